/**
 * @file semantic_tables.hpp
 * @brief ModifierSemantics / IndicatorSemantics lookup tables
 *
 * Two fixed maps SymbolId -> SemanticDescriptor, supplied at start-up.
 * Their key sets must be disjoint: a symbol is either a modifier or an
 * indicator, never both.
 *
 * JSON form:
 *   {
 *     "modifiers":  { "14647": {"type": "QUANTIFIER", "value": "many"} },
 *     "indicators": { "9011":  {"type": "NUMBER", "value": "plural"} }
 *   }
 */

#pragma once

#include <lexicon/symbol_record.hpp>
#include <lexicon/semantic_descriptor.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>

namespace Bliss {

enum class SymbolRole {
    Indicator,
    Modifier
};

inline const char* role_name(SymbolRole role) {
    return role == SymbolRole::Indicator ? "indicator" : "modifier";
}

class SemanticTables {
public:
    using Table = std::map<SymbolId, SemanticDescriptor>;

    SemanticTables() = default;

    /**
     * @throws std::invalid_argument if an id appears in both tables
     */
    SemanticTables(Table modifiers, Table indicators);

    /**
     * @throws std::invalid_argument on a malformed descriptor or overlapping keys
     */
    static SemanticTables from_json(const nlohmann::json& j);

    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static SemanticTables load_file(const std::filesystem::path& path);

    const Table& modifiers() const { return modifiers_; }
    const Table& indicators() const { return indicators_; }
    const Table& table_for(SymbolRole role) const {
        return role == SymbolRole::Indicator ? indicators_ : modifiers_;
    }

    const SemanticDescriptor* find(const SymbolId& id, SymbolRole role) const;

    bool is_modifier(const SymbolId& id) const { return modifiers_.count(id) != 0; }
    bool is_indicator(const SymbolId& id) const { return indicators_.count(id) != 0; }

    nlohmann::json to_json() const;

private:
    Table modifiers_;
    Table indicators_;
};

} // namespace Bliss
