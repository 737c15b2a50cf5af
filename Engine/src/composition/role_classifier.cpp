#include <composition/role_classifier.hpp>
#include <algorithm>

namespace Bliss {

nlohmann::json RoleAssignment::to_json() const {
    nlohmann::json j;
    j["classifier"] = classifier ? nlohmann::json(*classifier) : nlohmann::json(nullptr);
    j["specifiers"] = specifiers;
    j["indicators"] = indicators;
    j["modifiers"] = modifiers;
    j["errors"] = errors;
    return j;
}

// Priority order matters: first rule whose guard holds wins.
const RoleClassifier::Rule RoleClassifier::kRules[] = {
    {"indicator-anchored", &RoleClassifier::has_indicator,   &RoleClassifier::assign_around_indicator},
    {"part-of-speech",     &RoleClassifier::has_head_symbol, &RoleClassifier::assign_by_pos},
    {"all-satellite",      &RoleClassifier::always,          &RoleClassifier::assign_all_satellite},
};

RoleClassifier::RoleClassifier(const Dictionary& dictionary, const SemanticTables& tables)
    : dictionary_(dictionary), tables_(tables) {
    for (const auto& [id, d] : tables_.modifiers()) modifier_ids_.insert(id);
    for (const auto& [id, d] : tables_.indicators()) indicator_ids_.insert(id);
}

std::vector<SymbolId> RoleClassifier::filter_symbol_ids(const std::vector<std::string>& tokens) {
    std::vector<SymbolId> ids;
    ids.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (is_symbol_id(t)) ids.push_back(t);
    }
    return ids;
}

RoleAssignment RoleClassifier::classify(const std::vector<std::string>& tokens) const {
    RoleAssignment out;
    const Ids ids = filter_symbol_ids(tokens);

    if (ids.empty()) {
        out.errors.push_back("no valid symbol ids found");
        return out;
    }

    for (const Rule& rule : kRules) {
        if ((this->*rule.applies)(ids)) {
            (this->*rule.assign)(ids, out);
            break;
        }
    }
    return out;
}

bool RoleClassifier::is_classifier(const SymbolId& id) const {
    const SymbolRecord* rec = dictionary_.find(id);
    return rec != nullptr && is_head_bearing(rec->pos);
}

PosCategory RoleClassifier::pos_of(const SymbolId& id) const {
    const SymbolRecord* rec = dictionary_.find(id);
    return rec ? rec->pos : PosCategory::Unknown;
}

// ---------------------------------------------------------------------------
// Rule 1: indicator-anchored
// ---------------------------------------------------------------------------

bool RoleClassifier::has_indicator(const Ids& ids) const {
    return std::any_of(ids.begin(), ids.end(),
                       [this](const SymbolId& id) { return is_indicator(id); });
}

void RoleClassifier::assign_around_indicator(const Ids& ids, RoleAssignment& out) const {
    size_t first = 0;
    while (!is_indicator(ids[first])) ++first;

    if (first == 0) {
        out.errors.push_back("first symbol is an indicator; no classifier found before it");
        return;
    }

    // The governing head is the first coloured symbol before the indicator.
    // With no coloured symbol there, the symbol right before it governs.
    size_t head = first - 1;
    for (size_t k = 0; k < first; ++k) {
        if (!is_modifier(ids[k]) && is_head_bearing(pos_of(ids[k]))) {
            head = k;
            break;
        }
    }
    out.classifier = ids[head];

    for (size_t k = 0; k < head; ++k) {
        out.modifiers.push_back(ids[k]);
    }
    for (size_t k = head + 1; k < first; ++k) {
        if (is_modifier(ids[k])) out.modifiers.push_back(ids[k]);
        else out.specifiers.push_back(ids[k]);
    }
    for (size_t k = first; k < ids.size(); ++k) {
        const SymbolId& id = ids[k];
        if (is_indicator(id)) out.indicators.push_back(id);
        else if (is_modifier(id)) out.modifiers.push_back(id);
        else out.specifiers.push_back(id);
    }
}

// ---------------------------------------------------------------------------
// Rule 2: part-of-speech
// ---------------------------------------------------------------------------

bool RoleClassifier::has_head_symbol(const Ids& ids) const {
    return std::any_of(ids.begin(), ids.end(), [this](const SymbolId& id) {
        return !is_modifier(id) && is_classifier(id);
    });
}

void RoleClassifier::assign_by_pos(const Ids& ids, RoleAssignment& out) const {
    distribute_by_pos(ids, out);
}

void RoleClassifier::distribute_by_pos(const Ids& ids, RoleAssignment& out) const {
    for (const auto& id : ids) {
        if (is_modifier(id)) {
            out.modifiers.push_back(id);
        } else if (is_classifier(id)) {
            // Only the first head-bearing symbol classifies; later ones refine it.
            if (!out.classifier) out.classifier = id;
            else out.specifiers.push_back(id);
        } else {
            out.specifiers.push_back(id);
        }
    }
}

// ---------------------------------------------------------------------------
// Rule 3: all-satellite fallback
// ---------------------------------------------------------------------------

void RoleClassifier::assign_all_satellite(const Ids& ids, RoleAssignment& out) const {
    distribute_by_pos(ids, out);

    const SymbolId& first_id = ids.front();
    const SymbolRecord* rec = dictionary_.find(first_id);
    if (!rec) {
        out.errors.push_back("symbol " + first_id + " not found in knowledge graph");
        return;
    }
    if (!is_satellite(rec->pos)) {
        out.errors.push_back("no classifier found in composition");
        return;
    }

    // distribute_by_pos put the first id at the front of its bucket; only
    // that occurrence moves, later repeats keep their roles.
    out.classifier = first_id;
    std::vector<SymbolId>& bucket = is_modifier(first_id) ? out.modifiers : out.specifiers;
    bucket.erase(bucket.begin());
}

// ---------------------------------------------------------------------------

nlohmann::json RoleClassifier::symbol_info(const SymbolId& id) const {
    const SymbolRecord* rec = dictionary_.find(id);
    if (!rec) {
        return {{"error", "symbol " + id + " not found"}};
    }

    nlohmann::json info = {
        {"id", id},
        {"pos", rec->pos == PosCategory::Unknown ? "unknown" : pos_name(rec->pos)},
        {"glosses", rec->glosses},
        {"isCharacter", rec->is_character},
        {"explanation", rec->explanation},
    };
    if (rec->semantic_effect) {
        info["symbolSemantics"] = descriptor_to_json(*rec->semantic_effect);
    }

    if (const SemanticDescriptor* d = tables_.find(id, SymbolRole::Modifier)) {
        info["type"] = "modifier";
        info["semantics"] = descriptor_to_json(*d);
    } else if (const SemanticDescriptor* d = tables_.find(id, SymbolRole::Indicator)) {
        info["type"] = "indicator";
        info["semantics"] = descriptor_to_json(*d);
    } else {
        info["type"] = "character_or_word";
    }
    return info;
}

} // namespace Bliss
