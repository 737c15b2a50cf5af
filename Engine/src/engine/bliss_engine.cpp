#include <engine/bliss_engine.hpp>
#include <utils/logger.hpp>

namespace Bliss {

BlissEngine::BlissEngine(Dictionary dictionary, SemanticTables tables)
    : dictionary_(std::move(dictionary)),
      tables_(std::move(tables)),
      classifier_(dictionary_, tables_),
      extractor_(tables_),
      analyzer_(dictionary_, classifier_, extractor_),
      composer_(dictionary_, tables_) {}

BlissEngine::BlissEngine(const nlohmann::json& dictionary, const nlohmann::json& tables)
    : BlissEngine(Dictionary::from_json(dictionary), SemanticTables::from_json(tables)) {}

std::unique_ptr<BlissEngine> BlissEngine::from_config(const EngineConfig& config) {
    Logger::set_min_level(config.log_level);

    auto engine = std::make_unique<BlissEngine>(Dictionary::load_file(config.dictionary_path),
                                                SemanticTables::load_file(config.semantics_path));

    const auto& idx = engine->composer().indices();
    Logger::info("Indexed " + std::to_string(idx.gloss_to_id.size()) + " glosses, " +
                 std::to_string(idx.semantic_path_to_id.size()) + " semantic paths");
    return engine;
}

SymbolGlosses BlissEngine::symbol_glosses(const SymbolId& id, const std::string& language) const {
    return analyzer_.symbol_glosses(id, language);
}

nlohmann::json BlissEngine::composition_glosses(const std::vector<std::string>& composition,
                                                const std::string& language) const {
    return analyzer_.composition_glosses(composition, language);
}

CompositionAnalysis BlissEngine::analyze_composition(const std::vector<std::string>& composition,
                                                     const std::string& language) const {
    return analyzer_.analyze(composition, language);
}

nlohmann::json BlissEngine::composition_structure(const std::vector<std::string>& composition) const {
    return analyzer_.composition_structure(composition);
}

nlohmann::json BlissEngine::symbol_in_context(const SymbolId& id,
                                              const std::vector<std::string>& context,
                                              const std::string& language) const {
    return analyzer_.symbol_in_context(id, context, language);
}

CompositionResult BlissEngine::compose_from_spec(const CompositionSpec& spec) const {
    return composer_.compose_from_spec(spec);
}

CompositionResult BlissEngine::compose_from_spec(const nlohmann::json& spec) const {
    return composer_.compose_from_spec(CompositionSpec::from_json(spec));
}

CompositionResult BlissEngine::compose_with_ids(const SymbolId& classifier,
                                                const std::vector<SymbolId>& specifiers,
                                                const std::vector<SymbolId>& modifiers,
                                                const std::vector<SymbolId>& indicators) const {
    return composer_.compose_with_ids(classifier, specifiers, modifiers, indicators);
}

RoleAssignment BlissEngine::classify(const std::vector<std::string>& composition) const {
    return classifier_.classify(composition);
}

std::optional<SemanticFact> BlissEngine::extract_semantics(const SymbolId& id, SymbolRole role) const {
    return extractor_.extract(id, role);
}

nlohmann::json BlissEngine::symbol_info(const SymbolId& id) const {
    return classifier_.symbol_info(id);
}

nlohmann::json BlissEngine::knowledge_graph_info() const {
    const DictionaryStats s = dictionary_.stats();
    return {
        {"symbols", s.symbols},
        {"characters", s.characters},
        {"composed_words", s.composed_words},
        {"modifiers", tables_.modifiers().size()},
        {"indicators", tables_.indicators().size()},
        {"description", "Blissymbolics symbol dictionary"},
    };
}

} // namespace Bliss
