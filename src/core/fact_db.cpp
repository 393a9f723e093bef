#include "rune_lock/fact_db.hpp"
#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

namespace rune_lock {

FactDb::FactDb(size_t num_positions, size_t num_activations)
    : num_positions_(num_positions)
    , num_activations_(num_activations)
    , grid_(num_positions * num_activations) {
    if (num_positions > LOCK_SIZE || num_activations > LOCK_SIZE) {
        throw std::invalid_argument("FactDb size exceeds lock size: " +
                                    std::to_string(num_positions) + "x" +
                                    std::to_string(num_activations));
    }
}

// ============================================================================
// Grid access
// ============================================================================

std::optional<FactHandle>& FactDb::cell(Position position, Activation activation) {
    if (position.index() >= num_positions_ || activation.index() >= num_activations_) {
        throw std::out_of_range("Cell outside of fact grid");
    }
    return grid_[position.index() * num_activations_ + activation.index()];
}

const std::optional<FactHandle>& FactDb::cell(Position position, Activation activation) const {
    if (position.index() >= num_positions_ || activation.index() >= num_activations_) {
        throw std::out_of_range("Cell outside of fact grid");
    }
    return grid_[position.index() * num_activations_ + activation.index()];
}

FactHandle FactDb::append(Fact fact) {
    FactHandle handle{facts_.size()};
    facts_.push_back(std::move(fact));
    return handle;
}

size_t FactDb::line_count(View::Axis axis) const {
    return axis == View::Axis::Position ? num_positions_ : num_activations_;
}

size_t FactDb::line_length(View::Axis axis) const {
    return axis == View::Axis::Position ? num_activations_ : num_positions_;
}

const Fact* FactDb::get(FactHandle handle) const {
    if (handle.id >= facts_.size()) {
        return nullptr;
    }
    return &facts_[handle.id];
}

std::optional<FactHandle> FactDb::fact_at(Position position, Activation activation) const {
    if (position.index() >= num_positions_ || activation.index() >= num_activations_) {
        return std::nullopt;
    }
    return cell(position, activation);
}

size_t FactDb::count(FactKind kind) const {
    size_t n = 0;
    for (const auto& handle : grid_) {
        if (handle && facts_[handle->id].kind == kind) {
            ++n;
        }
    }
    return n;
}

std::optional<FactHandle> FactDb::first_contradiction() const {
    for (const auto& handle : grid_) {
        if (handle && facts_[handle->id].is_contradiction()) {
            return handle;
        }
    }
    return std::nullopt;
}

std::vector<Given> FactDb::givens() const {
    std::vector<Given> result;
    for (size_t p = 0; p < num_positions_; ++p) {
        for (size_t a = 0; a < num_activations_; ++a) {
            const auto& handle = grid_[p * num_activations_ + a];
            if (handle && facts_[handle->id].kind == FactKind::MustBe) {
                result.push_back(Given{Position(p), Activation(a), *handle});
            }
        }
    }
    return result;
}

std::vector<View::Cell> FactDb::possibilities_for(const View& view) const {
    std::vector<View::Cell> result;
    for (size_t k = 0; k < line_length(view.axis()); ++k) {
        auto c = view.cell(k);
        if (!cell(c.first, c.second)) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<View::Cell> FactDb::candidates_for(const View& view) const {
    std::vector<View::Cell> result;
    for (size_t k = 0; k < line_length(view.axis()); ++k) {
        auto c = view.cell(k);
        const auto& handle = cell(c.first, c.second);
        if (!handle || facts_[handle->id].kind == FactKind::MustBe) {
            result.push_back(c);
        }
    }
    return result;
}

Assignment FactDb::fixed_assignment() const {
    std::vector<Assignment::Pair> pairs;
    for (const auto& given : givens()) {
        pairs.emplace_back(given.position, given.activation);
    }
    return Assignment::from_pairs(pairs);
}

// ============================================================================
// Integration
// ============================================================================

FactDb::IntegrationResult FactDb::integrate_single_fact(Fact fact) {
    auto& slot = cell(fact.position, fact.activation);

    if (!slot) {
        FactHandle handle = append(std::move(fact));
        slot = handle;
        return {handle, true};
    }

    FactHandle existing = *slot;
    FactKind existing_kind = facts_[existing.id].kind;

    // 矛盾は吸収的: 何が来てもセルは変わらない
    if (existing_kind == FactKind::Contradiction) {
        return {existing, false};
    }

    // 新しい矛盾は矛盾でない事実を上書きする
    if (fact.kind == FactKind::Contradiction) {
        FactHandle handle = append(std::move(fact));
        slot = handle;
        return {handle, true};
    }

    if (existing_kind == fact.kind) {
        return {existing, false};
    }

    // MustBe と CannotBe の衝突。入ってきた事実も記録してから両方を引用する
    Position position = fact.position;
    Activation activation = fact.activation;
    FactHandle incoming = append(std::move(fact));
    FactHandle contradiction = append(Fact::contradiction_of(
        ContradictionKind::ContradictingRequirements, position, activation,
        {FactCitation{existing, Origin::Integration},
         FactCitation{incoming, Origin::Integration}}));
    slot = contradiction;
    return {contradiction, true};
}

ConsolidationResult FactDb::integrate_consolidation(std::vector<Fact> integrations) {
    ConsolidationStatus status = ConsolidationStatus::Unchanged;
    stats_.derived += integrations.size();

    for (auto& fact : integrations) {
        IntegrationResult result = integrate_single_fact(std::move(fact));
        if (facts_[result.handle.id].is_contradiction()) {
            return {ConsolidationStatus::Contradiction, result.handle};
        }
        if (result.changed) {
            status = ConsolidationStatus::Changed;
            ++stats_.integrated;
        }
    }
    return {status, std::nullopt};
}

ConsolidationResult FactDb::integrate_and_consolidate(Fact fact, const Lock& lock) {
    stats_ = ConsolidationStats{};

    IntegrationResult result = integrate_single_fact(std::move(fact));
    if (facts_[result.handle.id].is_contradiction()) {
        return {ConsolidationStatus::Contradiction, result.handle};
    }
    if (!result.changed) {
        return {ConsolidationStatus::Unchanged, std::nullopt};
    }
    ++stats_.integrated;

    return run_fixpoint(lock, true);
}

ConsolidationResult FactDb::consolidate(const Lock& lock) {
    stats_ = ConsolidationStats{};

    if (auto contradiction = first_contradiction()) {
        return {ConsolidationStatus::Contradiction, contradiction};
    }
    return run_fixpoint(lock, false);
}

ConsolidationResult FactDb::run_fixpoint(const Lock& lock, bool changed) {
    while (true) {
        ++stats_.passes;
        bool pass_changed = false;

        ConsolidationResult result = consolidate_lines(View::Axis::Position);
        if (!result.ok()) {
            return result;
        }
        pass_changed |= result.status == ConsolidationStatus::Changed;

        result = consolidate_lines(View::Axis::Activation);
        if (!result.ok()) {
            return result;
        }
        pass_changed |= result.status == ConsolidationStatus::Changed;

        result = consolidate_rules(lock);
        if (!result.ok()) {
            return result;
        }
        pass_changed |= result.status == ConsolidationStatus::Changed;

        if (!pass_changed) {
            break;
        }
        changed = true;
    }

    return {changed ? ConsolidationStatus::Changed : ConsolidationStatus::Unchanged,
            std::nullopt};
}

// ============================================================================
// Consolidation passes
// ============================================================================

ConsolidationResult FactDb::consolidate_lines(View::Axis axis) {
    std::vector<Fact> integrations;
    Origin origin = axis == View::Axis::Position ? Origin::PositionUniqueness
                                                 : Origin::ActivationUniqueness;

    for (size_t line = 0; line < line_count(axis); ++line) {
        View view = axis == View::Axis::Position ? View::of(Position(line))
                                                 : View::of(Activation(line));

        std::optional<FactHandle> must_be;
        std::vector<FactReason> cannot_be;
        std::optional<View::Cell> open;
        size_t open_count = 0;

        for (size_t k = 0; k < line_length(axis); ++k) {
            auto c = view.cell(k);
            const auto& handle = cell(c.first, c.second);
            if (!handle) {
                ++open_count;
                open = c;
                continue;
            }
            switch (facts_[handle->id].kind) {
                case FactKind::MustBe:
                    if (!must_be) {
                        must_be = handle;
                    }
                    break;
                case FactKind::CannotBe:
                    cannot_be.push_back(FactCitation{*handle, origin});
                    break;
                case FactKind::Contradiction:
                    break;
            }
        }

        if (must_be) {
            // 行の他のセルはすべて不可。2つ目の MustBe もここで衝突させる
            for (size_t k = 0; k < line_length(axis); ++k) {
                auto c = view.cell(k);
                const auto& handle = cell(c.first, c.second);
                if (handle == must_be) {
                    continue;
                }
                if (handle && facts_[handle->id].kind != FactKind::MustBe) {
                    continue;
                }
                integrations.push_back(Fact::cannot_be(c.first, c.second,
                                                       {FactCitation{*must_be, origin}}));
            }
        } else if (open_count == 1) {
            integrations.push_back(Fact::must_be(open->first, open->second, cannot_be));
        } else if (open_count == 0) {
            for (size_t k = 0; k < line_length(axis); ++k) {
                auto c = view.cell(k);
                const auto& handle = cell(c.first, c.second);
                if (handle && facts_[handle->id].is_contradiction()) {
                    continue;
                }
                integrations.push_back(Fact::contradiction_of(
                    ContradictionKind::NoOptionsLeft, c.first, c.second, cannot_be));
            }
        }
    }

    return integrate_consolidation(std::move(integrations));
}

ConsolidationResult FactDb::consolidate_rules(const Lock& lock) {
    std::vector<Fact> integrations;
    const auto& rules = lock.rules();

    // 一意性のサブパスで増えた MustBe も含めて、このサブパス開始時点の確定値を使う
    for (const Given& given : givens()) {
        Assignment::Pair placed{given.position, given.activation};

        for (size_t i = 0; i < rules.size(); ++i) {
            const Rule& rule = *rules[i];
            if (!rule.involves(lock, given.position, given.activation)) {
                continue;
            }
            std::vector<FactReason> reasons = {
                FactCitation{given.handle, Origin::RulePropagation},
                RuleCitation{i}};

            // 単独でルールを満たせない確定値は、それ自身が不可
            Assignment single;
            single.assign(given.position, given.activation);
            if (rule.validate(lock, single) != RuleStatus::Ok) {
                integrations.push_back(
                    Fact::cannot_be(given.position, given.activation, reasons));
                continue;
            }

            for (Activation other : rule.counterparts(lock, given.position, given.activation)) {
                if (other.index() >= num_activations_) {
                    continue;
                }
                for (const auto& candidate : candidates_for(View::of(other))) {
                    if (rule.validate_pair(lock, placed, candidate) != RuleStatus::Ok) {
                        integrations.push_back(
                            Fact::cannot_be(candidate.first, candidate.second, reasons));
                    }
                }
            }
        }
    }

    return integrate_consolidation(std::move(integrations));
}

// ============================================================================
// Output
// ============================================================================

void FactDb::dump(std::ostream& os) const {
    os << std::setw(4) << "";
    for (size_t a = 0; a < num_activations_; ++a) {
        os << std::setw(6) << ("#" + std::to_string(a + 1));
    }
    os << "\n";

    for (size_t p = 0; p < num_positions_; ++p) {
        os << std::setw(4) << p;
        for (size_t a = 0; a < num_activations_; ++a) {
            const auto& handle = grid_[p * num_activations_ + a];
            std::string text = ".";
            if (handle) {
                switch (facts_[handle->id].kind) {
                    case FactKind::MustBe: text = "+F"; break;
                    case FactKind::CannotBe: text = "-F"; break;
                    case FactKind::Contradiction: text = "!F"; break;
                }
                text += std::to_string(handle->id);
            }
            os << std::setw(6) << text;
        }
        os << "\n";
    }
}

} // namespace rune_lock
