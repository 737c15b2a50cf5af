/**
 * @file composition_analyzer.hpp
 * @brief Gloss retrieval and semantic analysis of Bliss compositions
 *
 * Combines the role classifier with the semantic extractor:
 *   tokens -> RoleAssignment -> glosses (classifier, specifiers)
 *                            -> semantic facts (indicators, then modifiers)
 */

#pragma once

#include <composition/role_classifier.hpp>
#include <composition/semantic_extractor.hpp>
#include <lexicon/dictionary.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Bliss {

/// Placeholder gloss for symbols with nothing to show.
inline constexpr const char* kUnknownGloss = "(unknown)";

/**
 * @brief Glosses of one role-tagged symbol inside an analysis.
 */
struct GlossInfo {
    SymbolId id;
    std::vector<std::string> glosses;
    bool is_character = false;
    bool found = true;  // false: id not in the dictionary, glosses = ["(unknown)"]

    nlohmann::json to_json() const;
};

/**
 * @brief Glosses and explanation of a single symbol (lookup by id).
 */
struct SymbolGlosses {
    SymbolId id;
    std::vector<std::string> glosses;
    std::string explanation;
    bool is_character = false;
    std::optional<std::string> error;

    nlohmann::json to_json() const;
};

struct CompositionAnalysis {
    std::vector<std::string> original_composition;
    RoleAssignment assignment;
    std::optional<GlossInfo> classifier_info;
    std::vector<GlossInfo> specifier_info;
    std::vector<SemanticFact> semantics;  // indicators first, then modifiers
    std::optional<std::string> error;     // first classification error, if any

    bool ok() const { return !error.has_value(); }
    nlohmann::json to_json() const;
};

class CompositionAnalyzer {
public:
    CompositionAnalyzer(const Dictionary& dictionary,
                        const RoleClassifier& classifier,
                        const SemanticExtractor& extractor);

    /**
     * @brief Classify a composition and extract its combined meaning.
     *
     * On a classification error the analysis carries the first error and the
     * partial role assignment; no glosses or semantics are produced.
     */
    CompositionAnalysis analyze(const std::vector<std::string>& tokens,
                                const std::string& language = "en") const;

    /**
     * @brief Glosses in `language`, else English, else ["(unknown)"].
     */
    GlossInfo gloss_info(const SymbolId& id, const std::string& language = "en") const;

    /**
     * @brief Glosses, explanation and character flag of one symbol.
     *
     * Falls back to English, then to an empty list. Unknown ids set `error`.
     */
    SymbolGlosses symbol_glosses(const SymbolId& id, const std::string& language = "en") const;

    /**
     * @brief Symbol glosses for every numeric token of a composition.
     */
    nlohmann::json composition_glosses(const std::vector<std::string>& tokens,
                                       const std::string& language = "en") const;

    /**
     * @brief symbol_glosses() plus the symbol's table `type`, and the role
     * assignment of `context` as `context_classification` when it is non-empty.
     */
    nlohmann::json symbol_in_context(const SymbolId& id,
                                     const std::vector<std::string>& context = {},
                                     const std::string& language = "en") const;

    /**
     * @brief Role buckets plus English glosses and indicator/modifier counts.
     */
    nlohmann::json composition_structure(const std::vector<std::string>& tokens) const;

private:
    const Dictionary& dictionary_;
    const RoleClassifier& classifier_;
    const SemanticExtractor& extractor_;
};

} // namespace Bliss
