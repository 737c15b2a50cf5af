/**
 * @file reverse_composer.hpp
 * @brief Synthesizes Bliss compositions from glosses, semantics or role-tagged ids
 *
 * Two entry points with deliberately different output orders:
 * - compose_from_spec:  [classifier] ++ specifiers ++ semantic symbols
 * - compose_with_ids:   modifiers ++ [classifier] ++ specifiers ++ indicators
 *
 * Reverse indices are built once at construction and never change, so a
 * composer can be shared between threads without locking.
 */

#pragma once

#include <lexicon/dictionary.hpp>
#include <lexicon/semantic_tables.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bliss {

/**
 * @brief Semantic description of a word to compose.
 *
 * `classifier` and `specifiers` are glosses; each `semantics` item is a
 * single-entry map {TYPE: value}, e.g. {"NUMBER": "plural"}.
 */
struct CompositionSpec {
    std::optional<std::string> classifier;
    std::vector<std::string> specifiers;
    std::vector<std::map<std::string, std::string>> semantics;

    /**
     * @brief Read a spec from JSON. Never throws on shape problems: a
     * non-object semantic item becomes an empty (unsupported) item, and
     * non-string values are kept in their JSON text form.
     */
    static CompositionSpec from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct ComposeError {
    enum class Kind {
        MissingField,
        NotFound
    };

    Kind kind;
    std::string message;
};

struct CompositionResult {
    std::vector<SymbolId> composition;
    std::vector<std::string> warnings;
    std::optional<ComposeError> error;  // set on fatal failures; composition is then empty

    bool ok() const { return !error.has_value(); }
    nlohmann::json to_json() const;
};

struct ReverseIndices {
    std::unordered_map<std::string, SymbolId> gloss_to_id;              // English gloss -> symbol
    std::unordered_map<SymbolId, SemanticDescriptor> id_to_effect;      // symbol -> own semantic effect
    std::unordered_map<std::string, SymbolId> semantic_path_to_id;      // "TYPE:value" (value lower-cased) -> symbol
};

class ReverseComposer {
public:
    ReverseComposer(const Dictionary& dictionary, const SemanticTables& tables);

    CompositionResult compose_from_spec(const CompositionSpec& spec) const;

    CompositionResult compose_with_ids(const SymbolId& classifier,
                                       const std::vector<SymbolId>& specifiers = {},
                                       const std::vector<SymbolId>& modifiers = {},
                                       const std::vector<SymbolId>& indicators = {}) const;

    /**
     * @brief Resolve a gloss to a symbol id.
     *
     * Exact hit in the English gloss index first (characters win over
     * composed words), then a case-insensitive scan of every language.
     */
    std::optional<SymbolId> find_by_gloss(const std::string& gloss) const;

    /**
     * @brief Symbol carrying {type, value}: indicator table, then modifier
     * table, then the dictionary's own "TYPE:value" effects.
     */
    std::optional<SymbolId> find_semantic_symbol(const std::string& type, const std::string& value) const;

    const SemanticDescriptor* semantic_effect(const SymbolId& id) const;

    const ReverseIndices& indices() const { return indices_; }

private:
    static ReverseIndices build_indices(const Dictionary& dictionary);
    static std::string semantic_path_key(const std::string& type, const std::string& value);

    const Dictionary& dictionary_;
    const SemanticTables& tables_;
    const ReverseIndices indices_;
};

} // namespace Bliss
