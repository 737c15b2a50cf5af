/**
 * @file semantic_extractor.hpp
 * @brief Maps indicator / modifier symbols to structured semantic facts
 */

#pragma once

#include <lexicon/semantic_tables.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace Bliss {

/**
 * @brief One extracted meaning unit, tagged with its source symbol and role.
 *
 * The descriptor keeps the table's shape (simple, alternatives, combined).
 */
struct SemanticFact {
    SymbolId symbol_id;
    SymbolRole role = SymbolRole::Modifier;
    SemanticDescriptor descriptor;

    /**
     * @brief JSON form:
     *   simple:       {"symbol_id": "9011", "indicator": {"NUMBER": "plural"}}
     *   alternatives: {"symbol_id": .., "type": "modifier", "alternatives": [..]}
     *   combined:     {"symbol_id": .., "type": "modifier", "combined": [..]}
     */
    nlohmann::json to_json() const;
};

class SemanticExtractor {
public:
    explicit SemanticExtractor(const SemanticTables& tables) : tables_(tables) {}

    /**
     * @brief Semantic fact for a symbol in the given role, or nullopt when the
     * symbol has no entry in that role's table.
     */
    std::optional<SemanticFact> extract(const SymbolId& id, SymbolRole role) const;

private:
    const SemanticTables& tables_;
};

} // namespace Bliss
