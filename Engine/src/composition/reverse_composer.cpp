#include <composition/reverse_composer.hpp>
#include <utils/unicode.hpp>

namespace Bliss {

// ---------------------------------------------------------------------------
// CompositionSpec / CompositionResult
// ---------------------------------------------------------------------------

static std::string json_text(const nlohmann::json& j) {
    return j.is_string() ? j.get<std::string>() : j.dump();
}

CompositionSpec CompositionSpec::from_json(const nlohmann::json& j) {
    CompositionSpec spec;
    if (!j.is_object()) return spec;

    if (j.contains("classifier") && !j["classifier"].is_null()) {
        spec.classifier = json_text(j["classifier"]);
    }

    if (j.contains("specifiers")) {
        const auto& specs = j["specifiers"];
        if (specs.is_array()) {
            for (const auto& s : specs) spec.specifiers.push_back(json_text(s));
        } else if (specs.is_string()) {
            spec.specifiers.push_back(specs.get<std::string>());
        }
    }

    if (j.contains("semantics") && j["semantics"].is_array()) {
        for (const auto& item : j["semantics"]) {
            std::map<std::string, std::string> entry;
            if (item.is_object()) {
                for (const auto& [key, value] : item.items()) {
                    entry.emplace(key, json_text(value));
                }
            }
            spec.semantics.push_back(std::move(entry));
        }
    }
    return spec;
}

nlohmann::json CompositionSpec::to_json() const {
    nlohmann::json j;
    if (classifier) j["classifier"] = *classifier;
    j["specifiers"] = specifiers;
    j["semantics"] = nlohmann::json::array();
    for (const auto& item : semantics) j["semantics"].push_back(nlohmann::json(item));
    return j;
}

nlohmann::json CompositionResult::to_json() const {
    nlohmann::json j = {{"composition", composition}, {"warnings", warnings}};
    if (error) {
        j["error"] = error->message;
        j["error_kind"] = error->kind == ComposeError::Kind::MissingField ? "missing_field" : "not_found";
    }
    return j;
}

// ---------------------------------------------------------------------------
// Index construction
// ---------------------------------------------------------------------------

ReverseComposer::ReverseComposer(const Dictionary& dictionary, const SemanticTables& tables)
    : dictionary_(dictionary), tables_(tables), indices_(build_indices(dictionary)) {}

// Values are folded so path lookups match the tables' case-insensitive values.
std::string ReverseComposer::semantic_path_key(const std::string& type, const std::string& value) {
    return SemanticPair{type, to_lower_utf8(value)}.path();
}

ReverseIndices ReverseComposer::build_indices(const Dictionary& dictionary) {
    ReverseIndices idx;

    for (const auto& [id, rec] : dictionary) {
        if (const auto* en = rec.glosses_for("en")) {
            for (const auto& gloss : *en) {
                auto [it, inserted] = idx.gloss_to_id.emplace(gloss, id);
                if (inserted) continue;

                // Characters are the canonical source for a gloss.
                const SymbolRecord* existing = dictionary.find(it->second);
                if (rec.is_character && existing && !existing->is_character) {
                    it->second = id;
                }
            }
        }

        if (rec.semantic_effect) {
            idx.id_to_effect.emplace(id, *rec.semantic_effect);
            if (const auto* simple = std::get_if<SimpleSemantic>(&*rec.semantic_effect)) {
                idx.semantic_path_to_id.emplace(semantic_path_key(simple->pair.type, simple->pair.value), id);
            }
        }
    }
    return idx;
}

// ---------------------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------------------

std::optional<SymbolId> ReverseComposer::find_by_gloss(const std::string& gloss) const {
    auto hit = indices_.gloss_to_id.find(gloss);
    if (hit != indices_.gloss_to_id.end()) return hit->second;

    const std::string wanted = to_lower_utf8(gloss);
    for (const auto& [id, rec] : dictionary_) {
        for (const auto& [lang, list] : rec.glosses) {
            for (const auto& g : list) {
                if (to_lower_utf8(g) == wanted) return id;
            }
        }
    }
    return std::nullopt;
}

std::optional<SymbolId> ReverseComposer::find_semantic_symbol(const std::string& type,
                                                              const std::string& value) const {
    for (SymbolRole role : {SymbolRole::Indicator, SymbolRole::Modifier}) {
        for (const auto& [id, descriptor] : tables_.table_for(role)) {
            if (descriptor_matches(descriptor, type, value)) return id;
        }
    }

    auto hit = indices_.semantic_path_to_id.find(semantic_path_key(type, value));
    if (hit != indices_.semantic_path_to_id.end()) return hit->second;
    return std::nullopt;
}

const SemanticDescriptor* ReverseComposer::semantic_effect(const SymbolId& id) const {
    auto it = indices_.id_to_effect.find(id);
    return it == indices_.id_to_effect.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Composition
// ---------------------------------------------------------------------------

CompositionResult ReverseComposer::compose_from_spec(const CompositionSpec& spec) const {
    CompositionResult result;

    if (!spec.classifier) {
        result.error = ComposeError{ComposeError::Kind::MissingField, "missing required field: classifier"};
        return result;
    }

    auto classifier_id = find_by_gloss(*spec.classifier);
    if (!classifier_id) {
        result.error = ComposeError{ComposeError::Kind::NotFound, "classifier not found: " + *spec.classifier};
        return result;
    }
    result.composition.push_back(*classifier_id);

    for (const auto& gloss : spec.specifiers) {
        if (auto id = find_by_gloss(gloss)) {
            result.composition.push_back(*id);
        } else {
            result.warnings.push_back("specifier not found: " + gloss);
        }
    }

    for (const auto& item : spec.semantics) {
        if (item.size() != 1) {
            result.warnings.push_back("unsupported semantic item: " + nlohmann::json(item).dump());
            continue;
        }
        const auto& [type, value] = *item.begin();
        if (auto id = find_semantic_symbol(type, value)) {
            result.composition.push_back(*id);
        } else {
            result.warnings.push_back("no symbol found for semantic " + type + ":" + value);
        }
    }
    return result;
}

CompositionResult ReverseComposer::compose_with_ids(const SymbolId& classifier,
                                                    const std::vector<SymbolId>& specifiers,
                                                    const std::vector<SymbolId>& modifiers,
                                                    const std::vector<SymbolId>& indicators) const {
    CompositionResult result;

    if (!dictionary_.contains(classifier)) {
        result.error = ComposeError{ComposeError::Kind::NotFound, "classifier " + classifier + " not found"};
        return result;
    }

    auto append_known = [&](const std::vector<SymbolId>& ids, const char* role) {
        for (const auto& id : ids) {
            if (dictionary_.contains(id)) {
                result.composition.push_back(id);
            } else {
                result.warnings.push_back(std::string(role) + " " + id + " not found");
            }
        }
    };

    append_known(modifiers, "modifier");
    result.composition.push_back(classifier);
    append_known(specifiers, "specifier");
    append_known(indicators, "indicator");
    return result;
}

} // namespace Bliss
