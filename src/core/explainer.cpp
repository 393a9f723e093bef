#include "rune_lock/explainer.hpp"
#include <string>

namespace rune_lock {

namespace {

/**
 * @brief 位置だけが異なる引用のまとまり
 */
struct CitationGroup {
    const Fact* sample;
    std::vector<FactHandle> handles;
};

bool same_group(const Fact& a, const Fact& b) {
    return a.kind == b.kind && a.contradiction == b.contradiction &&
           a.activation == b.activation && a.reasons == b.reasons;
}

const char* verb_of(FactKind kind) {
    switch (kind) {
        case FactKind::MustBe: return "must be on";
        case FactKind::CannotBe: return "cannot be on";
        case FactKind::Contradiction: return "caused a Contradiction on";
    }
    return "";
}

} // namespace

Explainer::Explainer(const FactDb& db, const Lock& lock)
    : db_(db)
    , lock_(lock) {}

bool Explainer::explain(FactHandle handle, size_t max_depth, std::ostream& os) const {
    const Fact* fact = db_.get(handle);
    if (!fact) {
        os << "Unknown Fact: " << handle << "\n";
        return false;
    }
    explain_fact(handle, *fact, 0, max_depth, os);
    return true;
}

void Explainer::indent(std::ostream& os, size_t depth) const {
    os << std::string(depth * 4, ' ');
}

void Explainer::explain_fact(FactHandle handle, const Fact& fact, size_t depth,
                             size_t max_depth, std::ostream& os) const {
    os << handle << ": " << fact << "\n";
    explain_reasons(fact.reasons, depth + 1, max_depth, os);
}

void Explainer::explain_reasons(const std::vector<FactReason>& reasons, size_t depth,
                                size_t max_depth, std::ostream& os) const {
    // 出力順: 理由の並び順。事実引用はグループの最初の出現位置で出力する
    struct Entry {
        const FactReason* leaf;  // nullptr ならグループ
        size_t group;
    };
    std::vector<Entry> entries;
    std::vector<CitationGroup> groups;
    size_t citations = 0;

    for (const auto& reason : reasons) {
        const auto* citation = std::get_if<FactCitation>(&reason);
        if (!citation) {
            entries.push_back(Entry{&reason, 0});
            continue;
        }
        ++citations;
        const Fact* cited = db_.get(citation->handle);
        if (!cited) {
            entries.push_back(Entry{&reason, 0});
            continue;
        }

        bool merged = false;
        for (auto& group : groups) {
            if (same_group(*group.sample, *cited)) {
                group.handles.push_back(citation->handle);
                merged = true;
                break;
            }
        }
        if (!merged) {
            groups.push_back(CitationGroup{cited, {citation->handle}});
            entries.push_back(Entry{nullptr, groups.size() - 1});
        }
    }

    bool truncated = depth > max_depth;

    for (const auto& entry : entries) {
        if (entry.leaf) {
            if (const auto* rule = std::get_if<RuleCitation>(entry.leaf)) {
                indent(os, depth);
                os << "-> Rule " << rule->rule_index;
                if (rule->rule_index < lock_.rules().size()) {
                    os << ": '" << lock_.rule(rule->rule_index).describe() << "'";
                }
                os << "\n";
            } else if (std::holds_alternative<Assumed>(*entry.leaf)) {
                indent(os, depth);
                os << "-> Fact Assumed.\n";
            } else if (!truncated) {
                // ログに存在しない引用
                indent(os, depth);
                os << "-> Unknown Fact: " << std::get<FactCitation>(*entry.leaf).handle << "\n";
            }
            continue;
        }

        if (truncated) {
            continue;
        }

        const CitationGroup& group = groups[entry.group];
        indent(os, depth);
        os << "-> ";
        if (group.handles.size() == 1) {
            explain_fact(group.handles.front(), *group.sample, depth, max_depth, os);
            continue;
        }

        os << group.sample->activation << " " << verb_of(group.sample->kind) << " ";
        for (size_t i = 0; i < group.handles.size(); ++i) {
            if (i > 0) os << ", ";
            os << db_.get(group.handles[i])->position;
        }
        os << " (";
        for (size_t i = 0; i < group.handles.size(); ++i) {
            if (i > 0) os << ", ";
            os << group.handles[i];
        }
        os << ")\n";
        explain_reasons(group.sample->reasons, depth + 1, max_depth, os);
    }

    if (truncated && citations > 0) {
        indent(os, depth);
        os << "-> ... " << citations << " cited facts omitted (depth limit)\n";
    }
}

} // namespace rune_lock
