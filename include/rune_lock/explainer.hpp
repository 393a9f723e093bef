/**
 * @file explainer.hpp
 * @brief 事実の正当化を木構造のテキストで説明する
 */
#ifndef RUNE_LOCK_EXPLAINER_HPP
#define RUNE_LOCK_EXPLAINER_HPP

#include "rune_lock/fact_db.hpp"
#include "rune_lock/lock.hpp"
#include <cstddef>
#include <ostream>
#include <vector>

namespace rune_lock {

/**
 * @brief 事実の説明器
 *
 * 事実を出力し、その理由を1段深いインデントで再帰的に出力する。
 * 位置だけが異なる引用（種類・アクティベーション・理由が同じ）は
 * 1行にまとめる。理由は常にログ上でより前の事実を引用するので、
 * 循環検出なしで停止する。
 */
class Explainer {
public:
    Explainer(const FactDb& db, const Lock& lock);

    /**
     * @brief 事実を説明
     * @param handle 説明する事実
     * @param max_depth 事実引用を展開する最大の深さ
     * @param os 出力先
     * @return 不明なハンドルなら false
     */
    bool explain(FactHandle handle, size_t max_depth, std::ostream& os) const;

private:
    void explain_fact(FactHandle handle, const Fact& fact, size_t depth, size_t max_depth,
                      std::ostream& os) const;
    void explain_reasons(const std::vector<FactReason>& reasons, size_t depth,
                         size_t max_depth, std::ostream& os) const;
    void indent(std::ostream& os, size_t depth) const;

    const FactDb& db_;
    const Lock& lock_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_EXPLAINER_HPP
