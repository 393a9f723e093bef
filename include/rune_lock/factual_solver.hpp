/**
 * @file factual_solver.hpp
 * @brief 仮定の探索木を管理する対話的ソルバー
 */
#ifndef RUNE_LOCK_FACTUAL_SOLVER_HPP
#define RUNE_LOCK_FACTUAL_SOLVER_HPP

#include "rune_lock/assumption_tree.hpp"
#include "rune_lock/fact_db.hpp"
#include "rune_lock/lock.hpp"
#include "rune_lock/view.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rune_lock {

/**
 * @brief 探索木ノードの状態
 */
enum class NodeStatus {
    Alive,         // まだ矛盾していない
    Contradicted,  // 仮定の結果、矛盾が導かれた
    Solved         // 全位置が確定し、ロックの全ルールを満たす
};

std::ostream& operator<<(std::ostream& os, NodeStatus status);

/**
 * @brief ノードを作った操作
 */
struct SolverAction {
    std::optional<Assignment::Pair> assumption;  // std::nullopt ならルート

    bool is_root() const { return !assumption.has_value(); }
};

std::ostream& operator<<(std::ostream& os, const SolverAction& action);

/**
 * @brief 探索木ノードのデータ
 */
struct SolverNode {
    FactDb facts;
    SolverAction action;
    NodeStatus status;
    std::optional<FactHandle> contradiction;

    bool is_terminal() const { return status != NodeStatus::Alive; }
};

std::ostream& operator<<(std::ostream& os, const SolverNode& node);

/**
 * @brief 現在ノードの要約
 */
struct SolverSnapshot {
    NodeHandle node;
    NodeStatus status;
    std::optional<Assignment> assignment;   // 確定値の射影（射影できない場合は std::nullopt）
    std::string assignment_error;
    std::optional<LockViolation> violation;
    size_t must_be = 0;
    size_t cannot_be = 0;
    size_t contradictions = 0;
    size_t logged = 0;
};

/**
 * @brief 対話的ソルバー
 *
 * 仮定を置くたびに現在ノードの FactDb を複製して事実を統合し、
 * 結果を子ノードとして記録する。ノードは削除されないので、
 * 任意のノードへ戻って別の仮定を試せる。
 *
 * lock はソルバーより長く生存すること。
 */
class FactualSolver {
public:
    explicit FactualSolver(const Lock& lock);

    /**
     * @brief 現在ノードで「position は activation」と仮定する
     *
     * 新しい子ノードを作り、カーソルをそこへ移す。
     * @return 作成したノード。現在ノードが終端（矛盾/解決済み）なら std::nullopt
     */
    std::optional<NodeHandle> assume(Activation activation, Position position);

    /**
     * @brief 行の未確定セルをすべて仮定として試す
     *
     * 兄弟ノードを1組作り、カーソルは呼び出し前のノードに戻す。
     * @return 作成したノード
     */
    std::vector<NodeHandle> try_possibilities(const View& view);

    /**
     * @brief 外部入力の id からノードを取得
     * @return 存在しない id なら std::nullopt
     */
    std::optional<NodeHandle> get_handle(size_t id) const { return tree_.get_handle(id); }

    void set_current(NodeHandle node) { current_ = node; }
    NodeHandle current() const { return current_; }

    const SolverNode& node(NodeHandle handle) const { return tree_[handle]; }
    const SolverNode& current_node() const { return tree_[current_]; }
    const AssumptionTree<SolverNode>& tree() const { return tree_; }
    const Lock& lock() const { return lock_; }

    /**
     * @brief 現在ノードの要約を取得
     */
    SolverSnapshot peek() const;

    /**
     * @brief 木、現在ノード、割当、検証結果、事実数を出力
     */
    void display(std::ostream& os) const;

    /**
     * @brief 現在ノードの事実を説明
     * @return 不明なハンドルなら false
     */
    bool explain(FactHandle handle, size_t max_depth, std::ostream& os) const;

    /**
     * @brief 現在ノードの知識グリッドを出力
     */
    void dump_knowledge(std::ostream& os) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    void set_explain_depth(size_t depth) { explain_depth_ = depth; }
    size_t explain_depth() const { return explain_depth_; }

private:
    NodeStatus classify(const FactDb& facts) const;

    const Lock& lock_;
    AssumptionTree<SolverNode> tree_;
    NodeHandle current_;
    bool verbose_ = false;
    size_t explain_depth_ = 10;
};

} // namespace rune_lock

#endif // RUNE_LOCK_FACTUAL_SOLVER_HPP
