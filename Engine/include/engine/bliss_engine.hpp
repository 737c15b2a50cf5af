/**
 * @file bliss_engine.hpp
 * @brief Single entry point for Blissymbolics analysis and composition
 *
 * Owns the dictionary and semantic tables and builds the classifier,
 * analyzer and composer once. Every call is delegated; nothing is mutated
 * after construction.
 *
 * Use cases:
 * 1. glosses and explanations for existing symbols / compositions
 * 2. role analysis and combined semantics of new compositions
 * 3. composing new words from a semantic specification or from ids
 */

#pragma once

#include <export.hpp>
#include <config/engine_config.hpp>
#include <lexicon/dictionary.hpp>
#include <lexicon/semantic_tables.hpp>
#include <composition/role_classifier.hpp>
#include <composition/semantic_extractor.hpp>
#include <composition/composition_analyzer.hpp>
#include <composition/reverse_composer.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Bliss {

class BLISS_API BlissEngine {
public:
    BlissEngine(Dictionary dictionary, SemanticTables tables);

    /**
     * @throws std::invalid_argument if `dictionary` is not a JSON object
     */
    BlissEngine(const nlohmann::json& dictionary, const nlohmann::json& tables);

    BlissEngine(const BlissEngine&) = delete;
    BlissEngine& operator=(const BlissEngine&) = delete;

    /**
     * @brief Load dictionary and tables from the configured files.
     */
    static std::unique_ptr<BlissEngine> from_config(const EngineConfig& config);

    // Use case 1: glosses
    SymbolGlosses symbol_glosses(const SymbolId& id, const std::string& language = "en") const;
    nlohmann::json composition_glosses(const std::vector<std::string>& composition,
                                       const std::string& language = "en") const;

    // Use case 2: analysis
    CompositionAnalysis analyze_composition(const std::vector<std::string>& composition,
                                            const std::string& language = "en") const;
    nlohmann::json composition_structure(const std::vector<std::string>& composition) const;
    nlohmann::json symbol_in_context(const SymbolId& id,
                                     const std::vector<std::string>& context = {},
                                     const std::string& language = "en") const;

    // Use case 3: composition
    CompositionResult compose_from_spec(const CompositionSpec& spec) const;
    CompositionResult compose_from_spec(const nlohmann::json& spec) const;
    CompositionResult compose_with_ids(const SymbolId& classifier,
                                       const std::vector<SymbolId>& specifiers = {},
                                       const std::vector<SymbolId>& modifiers = {},
                                       const std::vector<SymbolId>& indicators = {}) const;

    // Utilities
    RoleAssignment classify(const std::vector<std::string>& composition) const;
    std::optional<SemanticFact> extract_semantics(const SymbolId& id, SymbolRole role) const;
    nlohmann::json symbol_info(const SymbolId& id) const;
    bool is_classifier(const SymbolId& id) const { return classifier_.is_classifier(id); }
    bool is_modifier(const SymbolId& id) const { return classifier_.is_modifier(id); }
    bool is_indicator(const SymbolId& id) const { return classifier_.is_indicator(id); }

    DictionaryStats dictionary_stats() const { return dictionary_.stats(); }
    nlohmann::json knowledge_graph_info() const;

    const Dictionary& dictionary() const { return dictionary_; }
    const SemanticTables& semantic_tables() const { return tables_; }
    const ReverseComposer& composer() const { return composer_; }

private:
    // Declaration order is construction order: the components below hold
    // references into dictionary_ and tables_.
    const Dictionary dictionary_;
    const SemanticTables tables_;
    RoleClassifier classifier_;
    SemanticExtractor extractor_;
    CompositionAnalyzer analyzer_;
    ReverseComposer composer_;
};

} // namespace Bliss
