#include "rune_lock/factual_solver.hpp"
#include "rune_lock/explainer.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rune_lock {

std::ostream& operator<<(std::ostream& os, NodeStatus status) {
    switch (status) {
        case NodeStatus::Alive: return os << "alive";
        case NodeStatus::Contradicted: return os << "contradicted";
        case NodeStatus::Solved: return os << "solved";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const SolverAction& action) {
    if (action.is_root()) {
        return os << "Root";
    }
    return os << "Assume " << action.assumption->first << " = " << action.assumption->second;
}

std::ostream& operator<<(std::ostream& os, const SolverNode& node) {
    switch (node.status) {
        case NodeStatus::Alive: os << "[ ]"; break;
        case NodeStatus::Contradicted: os << "[x " << *node.contradiction << "]"; break;
        case NodeStatus::Solved: os << "[solved]"; break;
    }
    return os << " " << node.action;
}

namespace {

/**
 * @brief 割当を外側・内側の2つのリングとして描く
 */
void draw_rings(std::ostream& os, const Lock& lock, const Assignment& assignment) {
    for (size_t ring = 0; ring < 2; ++ring) {
        os << (ring == 0 ? "  outer:" : "  inner:");
        for (size_t k = 0; k < RING_SIZE; ++k) {
            Position position(ring * RING_SIZE + k);
            std::ostringstream value;
            if (auto activation = assignment.activation_at(position)) {
                value << *activation;
            } else {
                value << "--";
            }
            os << "  " << std::setw(2) << position.index() << ":" << lock.rune(position)
               << " " << std::left << std::setw(3) << value.str() << std::right;
        }
        os << "\n";
    }
}

} // namespace

FactualSolver::FactualSolver(const Lock& lock)
    : lock_(lock)
    , tree_(SolverNode{FactDb(), SolverAction{std::nullopt}, NodeStatus::Alive, std::nullopt})
    , current_(tree_.root()) {}

NodeStatus FactualSolver::classify(const FactDb& facts) const {
    if (facts.count(FactKind::MustBe) != LOCK_SIZE) {
        return NodeStatus::Alive;
    }
    Assignment assignment = facts.fixed_assignment();
    if (!assignment.is_complete() || lock_.validate(assignment)) {
        return NodeStatus::Alive;
    }
    return NodeStatus::Solved;
}

std::optional<NodeHandle> FactualSolver::assume(Activation activation, Position position) {
    const SolverNode& parent = tree_[current_];
    if (parent.is_terminal()) {
        if (verbose_) {
            std::cerr << "% [verbose] node " << current_ << " is " << parent.status
                      << ", assumption ignored\n";
        }
        return std::nullopt;
    }

    if (verbose_) {
        std::cerr << "% [verbose] assume " << position << " = " << activation
                  << " on node " << current_ << "\n";
    }

    FactDb facts = parent.facts;
    ConsolidationResult result =
        facts.integrate_and_consolidate(Fact::assumption(position, activation), lock_);

    if (verbose_) {
        const auto& stats = facts.stats();
        std::cerr << "% [verbose] consolidation: passes=" << stats.passes
                  << " derived=" << stats.derived
                  << " integrated=" << stats.integrated << "\n";
    }

    NodeStatus status = result.ok() ? classify(facts) : NodeStatus::Contradicted;
    std::optional<FactHandle> contradiction = result.contradiction;

    current_ = tree_.insert_child(
        current_,
        SolverNode{std::move(facts), SolverAction{Assignment::Pair{position, activation}},
                   status, contradiction});

    if (verbose_) {
        std::cerr << "% [verbose] node " << current_ << " is " << status;
        if (contradiction) {
            std::cerr << " (" << *contradiction << ")";
        }
        std::cerr << "\n";
    }
    return current_;
}

std::vector<NodeHandle> FactualSolver::try_possibilities(const View& view) {
    NodeHandle origin = current_;
    std::vector<View::Cell> possibilities = tree_[origin].facts.possibilities_for(view);

    if (verbose_) {
        std::cerr << "% [verbose] try " << view << ": " << possibilities.size()
                  << " possibilities\n";
    }

    std::vector<NodeHandle> created;
    for (const auto& cell : possibilities) {
        if (auto child = assume(cell.second, cell.first)) {
            created.push_back(*child);
        }
        current_ = origin;
    }
    return created;
}

SolverSnapshot FactualSolver::peek() const {
    const SolverNode& node = tree_[current_];
    SolverSnapshot snapshot;
    snapshot.node = current_;
    snapshot.status = node.status;

    try {
        snapshot.assignment = node.facts.fixed_assignment();
        snapshot.violation = lock_.validate(*snapshot.assignment);
    } catch (const AssignmentError& e) {
        // 矛盾で中断したノードでは MustBe が重複しうる
        snapshot.assignment_error = e.what();
    }

    snapshot.must_be = node.facts.count(FactKind::MustBe);
    snapshot.cannot_be = node.facts.count(FactKind::CannotBe);
    snapshot.contradictions = node.facts.count(FactKind::Contradiction);
    snapshot.logged = node.facts.size();
    return snapshot;
}

void FactualSolver::display(std::ostream& os) const {
    tree_.print(os, current_);
    os << "Current State: " << current_ << "\n";

    SolverSnapshot snapshot = peek();
    if (snapshot.assignment) {
        draw_rings(os, lock_, *snapshot.assignment);
        if (snapshot.violation) {
            os << "Invalid Assignment: Rule " << snapshot.violation->rule_index << " ('"
               << lock_.rule(snapshot.violation->rule_index).describe() << "') is "
               << snapshot.violation->status << "\n";
        } else if (snapshot.status == NodeStatus::Solved) {
            os << "Solved.\n";
        } else if (snapshot.status == NodeStatus::Alive) {
            os << "Valid State.\n";
        }
    } else {
        os << "Inconsistent Assignment: " << snapshot.assignment_error << "\n";
    }

    const SolverNode& node = tree_[current_];
    if (node.contradiction) {
        os << "Contradiction: " << *node.contradiction << ": "
           << *node.facts.get(*node.contradiction) << "\n";
    }

    os << "Facts: " << snapshot.must_be << " must be, " << snapshot.cannot_be
       << " cannot be, " << snapshot.contradictions << " contradictions ("
       << snapshot.logged << " logged)\n";
}

bool FactualSolver::explain(FactHandle handle, size_t max_depth, std::ostream& os) const {
    os << "Explaining Fact: " << handle << " in state " << current_ << "\n";
    Explainer explainer(tree_[current_].facts, lock_);
    return explainer.explain(handle, max_depth, os);
}

void FactualSolver::dump_knowledge(std::ostream& os) const {
    tree_[current_].facts.dump(os);
}

} // namespace rune_lock
