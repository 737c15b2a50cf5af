/**
 * @file dictionary.hpp
 * @brief Immutable in-memory Blissymbolics dictionary
 *
 * Maps symbol id -> SymbolRecord. Built once (from JSON or from records)
 * and read-only afterwards, so concurrent readers need no locking.
 * Iteration order is ascending by id string and never changes.
 */

#pragma once

#include <lexicon/symbol_record.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <cstddef>

namespace Bliss {

struct DictionaryStats {
    size_t symbols = 0;
    size_t characters = 0;
    size_t composed_words = 0;
};

class Dictionary {
public:
    using Map = std::map<SymbolId, SymbolRecord>;

    Dictionary() = default;
    explicit Dictionary(Map symbols);

    /**
     * @brief Build from the cleaned dictionary JSON (object keyed by id).
     *
     * Record fields: pos, isCharacter, glosses {lang: [..]}, explanation,
     * semantics, is_old. Missing optional fields take their defaults.
     *
     * @throws std::invalid_argument if the root is not a JSON object
     */
    static Dictionary from_json(const nlohmann::json& j);

    /**
     * @brief Load and parse a dictionary JSON file.
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static Dictionary load_file(const std::filesystem::path& path);

    const SymbolRecord* find(const SymbolId& id) const;
    bool contains(const SymbolId& id) const { return symbols_.count(id) != 0; }

    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

    const Map& symbols() const { return symbols_; }
    Map::const_iterator begin() const { return symbols_.begin(); }
    Map::const_iterator end() const { return symbols_.end(); }

    DictionaryStats stats() const;

private:
    Map symbols_;
};

/**
 * @brief Parse one record. The id is taken from the enclosing key.
 */
SymbolRecord record_from_json(const SymbolId& id, const nlohmann::json& j);

} // namespace Bliss
