/**
 * @file gloss_cleaner.hpp
 * @brief Offline preparation of the Bliss dictionary: raw descriptions -> glosses
 *
 * A raw description such as "autumn,_fall_(ckb)" or "glove(s)_(OLD)" becomes
 * a list of clean glosses:
 * - trailing "_(OLD)" is removed and flags the symbol as old
 * - trailing "-(to)" (verb marker) is removed
 * - underscores become spaces
 * - a trailing " (context)" is re-attached to every comma-separated part
 * - "word(s)" expands to "word" and "words"
 */

#pragma once

#include <lexicon/symbol_record.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Bliss {

struct CleanedGlosses {
    std::vector<std::string> glosses;
    bool is_old = false;
};

class GlossCleaner {
public:
    static CleanedGlosses clean_description(const std::string& raw);

    /// "glove(s)" -> {"glove", "gloves"}; anything else -> {text}
    static std::vector<std::string> expand_plural(const std::string& text);

    /**
     * @brief Fixed English glosses for punctuation, digit and letter symbols,
     * or nullptr when the id has none.
     */
    static const std::vector<std::string>* special_glosses(const SymbolId& id);

    /**
     * @brief Clean one raw record: "description" -> "glosses", "is_old",
     * and POS-derived "semantics".
     */
    static nlohmann::json clean_record(const SymbolId& id, const nlohmann::json& item);

    /**
     * @throws std::invalid_argument if `raw` is not a JSON object keyed by id
     */
    static nlohmann::json clean_dictionary(const nlohmann::json& raw);
};

} // namespace Bliss
