#include <composition/composition_analyzer.hpp>

namespace Bliss {

nlohmann::json GlossInfo::to_json() const {
    nlohmann::json j = {{"id", id}, {"gloss", glosses}, {"isCharacter", is_character}};
    if (!found) j["error"] = "not found";
    return j;
}

nlohmann::json SymbolGlosses::to_json() const {
    if (error) return {{"error", *error}};
    return {
        {"id", id},
        {"glosses", glosses},
        {"explanation", explanation},
        {"isCharacter", is_character},
    };
}

nlohmann::json CompositionAnalysis::to_json() const {
    if (error) {
        return {{"error", *error}, {"details", assignment.to_json()}};
    }

    nlohmann::json j;
    j["original_composition"] = original_composition;
    j["classifier"] = assignment.classifier ? nlohmann::json(*assignment.classifier) : nlohmann::json(nullptr);
    j["classifier_info"] = classifier_info ? classifier_info->to_json() : nlohmann::json(nullptr);
    j["specifiers"] = assignment.specifiers;
    j["specifier_info"] = nlohmann::json::array();
    for (const auto& info : specifier_info) j["specifier_info"].push_back(info.to_json());
    j["semantics"] = nlohmann::json::array();
    for (const auto& fact : semantics) j["semantics"].push_back(fact.to_json());
    j["indicators"] = assignment.indicators;
    j["modifiers"] = assignment.modifiers;
    return j;
}

CompositionAnalyzer::CompositionAnalyzer(const Dictionary& dictionary,
                                         const RoleClassifier& classifier,
                                         const SemanticExtractor& extractor)
    : dictionary_(dictionary), classifier_(classifier), extractor_(extractor) {}

CompositionAnalysis CompositionAnalyzer::analyze(const std::vector<std::string>& tokens,
                                                 const std::string& language) const {
    CompositionAnalysis result;
    result.original_composition = tokens;
    result.assignment = classifier_.classify(tokens);

    if (!result.assignment.ok()) {
        result.error = result.assignment.errors.front();
        return result;
    }

    const RoleAssignment& roles = result.assignment;
    if (roles.classifier) {
        result.classifier_info = gloss_info(*roles.classifier, language);
    }
    for (const auto& id : roles.specifiers) {
        result.specifier_info.push_back(gloss_info(id, language));
    }

    for (const auto& id : roles.indicators) {
        if (auto fact = extractor_.extract(id, SymbolRole::Indicator)) {
            result.semantics.push_back(std::move(*fact));
        }
    }
    for (const auto& id : roles.modifiers) {
        if (auto fact = extractor_.extract(id, SymbolRole::Modifier)) {
            result.semantics.push_back(std::move(*fact));
        }
    }
    return result;
}

GlossInfo CompositionAnalyzer::gloss_info(const SymbolId& id, const std::string& language) const {
    GlossInfo info;
    info.id = id;

    const SymbolRecord* rec = dictionary_.find(id);
    if (!rec) {
        info.found = false;
        info.glosses = {kUnknownGloss};
        return info;
    }

    info.is_character = rec->is_character;
    if (const auto* list = rec->glosses_for(language)) {
        info.glosses = *list;
    } else if (const auto* en = rec->glosses_for("en")) {
        info.glosses = *en;
    } else {
        info.glosses = {kUnknownGloss};
    }
    return info;
}

SymbolGlosses CompositionAnalyzer::symbol_glosses(const SymbolId& id, const std::string& language) const {
    SymbolGlosses out;
    out.id = id;

    const SymbolRecord* rec = dictionary_.find(id);
    if (!rec) {
        out.error = "symbol " + id + " not found";
        return out;
    }

    if (const auto* list = rec->glosses_for(language)) {
        out.glosses = *list;
    } else if (const auto* en = rec->glosses_for("en")) {
        out.glosses = *en;
    }
    out.explanation = rec->explanation;
    out.is_character = rec->is_character;
    return out;
}

nlohmann::json CompositionAnalyzer::composition_glosses(const std::vector<std::string>& tokens,
                                                        const std::string& language) const {
    nlohmann::json j = {{"composition", tokens}, {"components", nlohmann::json::array()}};
    for (const auto& token : tokens) {
        if (is_symbol_id(token)) {
            j["components"].push_back(symbol_glosses(token, language).to_json());
        }
    }
    return j;
}

nlohmann::json CompositionAnalyzer::symbol_in_context(const SymbolId& id,
                                                      const std::vector<std::string>& context,
                                                      const std::string& language) const {
    nlohmann::json j = symbol_glosses(id, language).to_json();
    j["type"] = classifier_.symbol_info(id).value("type", "unknown");

    if (!context.empty()) {
        j["context_classification"] = classifier_.classify(context).to_json();
    }
    return j;
}

nlohmann::json CompositionAnalyzer::composition_structure(const std::vector<std::string>& tokens) const {
    const RoleAssignment roles = classifier_.classify(tokens);

    nlohmann::json specifier_glosses = nlohmann::json::array();
    for (const auto& id : roles.specifiers) {
        specifier_glosses.push_back(gloss_info(id).to_json());
    }

    nlohmann::json structure = roles.to_json();
    structure.erase("errors");

    return {
        {"original_composition", tokens},
        {"structure", structure},
        {"interpretation", {
            {"classifier_glosses", roles.classifier ? gloss_info(*roles.classifier).to_json() : nlohmann::json(nullptr)},
            {"specifier_glosses", specifier_glosses},
            {"indicator_count", roles.indicators.size()},
            {"modifier_count", roles.modifiers.size()},
        }},
        {"errors", roles.errors},
    };
}

} // namespace Bliss
