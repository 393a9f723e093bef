/**
 * @file fact_db.hpp
 * @brief 正当化付き事実データベース（伝播エンジン）
 */
#ifndef RUNE_LOCK_FACT_DB_HPP
#define RUNE_LOCK_FACT_DB_HPP

#include "rune_lock/assignment.hpp"
#include "rune_lock/fact.hpp"
#include "rune_lock/lock.hpp"
#include "rune_lock/view.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>

namespace rune_lock {

/**
 * @brief 統合・伝播の結果の状態
 */
enum class ConsolidationStatus {
    Unchanged,
    Changed,
    Contradiction
};

/**
 * @brief 統合・伝播の結果
 *
 * 矛盾は例外ではなく値として返す。
 * status == Contradiction のとき contradiction に矛盾事実のハンドルが入る。
 */
struct ConsolidationResult {
    ConsolidationStatus status;
    std::optional<FactHandle> contradiction;

    bool ok() const { return status != ConsolidationStatus::Contradiction; }
};

/**
 * @brief 直近の統合呼び出しの統計
 */
struct ConsolidationStats {
    size_t passes = 0;       // 不動点ループの周回数
    size_t derived = 0;      // 推論で生成した事実の数（重複含む）
    size_t integrated = 0;   // 実際にデータベースを変化させた事実の数
};

/**
 * @brief 確定した組 (position, activation) とその事実
 */
struct Given {
    Position position;
    Activation activation;
    FactHandle handle;
};

/**
 * @brief 事実データベース
 *
 * position x activation のグリッドに、各セルの現在の事実へのハンドルを持つ。
 * 事実本体は追記のみのログに格納し、ハンドルはログのインデックス。
 * 値としてコピー可能で、探索木のノードごとに1つのスナップショットを持つ。
 *
 * 推論は3種類のサブパスを不動点まで繰り返す:
 * 1. 位置ごとの一意性
 * 2. アクティベーションごとの一意性
 * 3. ルール伝播
 * 各サブパスは推論結果をまず集め、その後1件ずつ統合する。
 */
class FactDb {
public:
    /**
     * @brief 空のデータベースを作成
     * @throws std::invalid_argument どちらかのサイズが LOCK_SIZE を超える場合
     */
    explicit FactDb(size_t num_positions = LOCK_SIZE, size_t num_activations = LOCK_SIZE);

    /**
     * @brief 事実を1つ統合し、不動点まで推論する
     *
     * 事実が矛盾セルに着地した場合、または推論中に矛盾が生じた場合は
     * Contradiction を返す。矛盾事実はデータベースに残る。
     */
    ConsolidationResult integrate_and_consolidate(Fact fact, const Lock& lock);

    /**
     * @brief 新しい事実なしで不動点まで推論する
     *
     * 推論済みのデータベースに対しては Unchanged を返す。
     */
    ConsolidationResult consolidate(const Lock& lock);

    /**
     * @brief ハンドルから事実を取得
     * @return 不明なハンドルなら nullptr
     */
    const Fact* get(FactHandle handle) const;

    /**
     * @brief セルの現在の事実
     */
    std::optional<FactHandle> fact_at(Position position, Activation activation) const;

    const std::vector<Fact>& facts() const { return facts_; }
    size_t size() const { return facts_.size(); }
    size_t num_positions() const { return num_positions_; }
    size_t num_activations() const { return num_activations_; }

    /**
     * @brief 現在グリッド上にある kind の事実の数
     */
    size_t count(FactKind kind) const;

    /**
     * @brief グリッド上の最初の矛盾
     */
    std::optional<FactHandle> first_contradiction() const;

    /**
     * @brief MustBe のセル（グリッド順）
     */
    std::vector<Given> givens() const;

    /**
     * @brief 行の中で事実がまだ無いセル（探索の選択肢）
     */
    std::vector<View::Cell> possibilities_for(const View& view) const;

    /**
     * @brief 行の中でまだ除外されていないセル（事実なし、または MustBe）
     */
    std::vector<View::Cell> candidates_for(const View& view) const;

    /**
     * @brief MustBe のセルを割当に射影
     * @throws AssignmentError 同じ位置/アクティベーションに2つの MustBe がある場合
     */
    Assignment fixed_assignment() const;

    const ConsolidationStats& stats() const { return stats_; }

    /**
     * @brief 知識グリッドを出力（. 不明, +Fn 必須, -Fn 不可, !Fn 矛盾）
     */
    void dump(std::ostream& os) const;

private:
    /// 1件の統合結果（handle はそのセルの現在の事実）
    struct IntegrationResult {
        FactHandle handle;
        bool changed;
    };

    IntegrationResult integrate_single_fact(Fact fact);
    ConsolidationResult run_fixpoint(const Lock& lock, bool changed);
    ConsolidationResult consolidate_lines(View::Axis axis);
    ConsolidationResult consolidate_rules(const Lock& lock);
    ConsolidationResult integrate_consolidation(std::vector<Fact> integrations);

    size_t line_length(View::Axis axis) const;
    size_t line_count(View::Axis axis) const;

    std::optional<FactHandle>& cell(Position position, Activation activation);
    const std::optional<FactHandle>& cell(Position position, Activation activation) const;

    FactHandle append(Fact fact);

    size_t num_positions_;
    size_t num_activations_;
    std::vector<Fact> facts_;
    std::vector<std::optional<FactHandle>> grid_;
    ConsolidationStats stats_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_FACT_DB_HPP
