/**
 * @file duplicate_glosses.hpp
 * @brief Finds glosses shared by several symbols with identical metadata
 *
 * Two symbols are duplicates for a language when they list the same gloss
 * and agree on both the "is_old" flag and the "semantics" object. Report keys
 * carry that metadata: "house", "house (OLD)", "run (POS: verb)".
 */

#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <cstddef>

namespace Bliss {

struct DuplicateReport {
    nlohmann::json groups = nlohmann::json::object();  // lang -> { key -> [ids] }
    std::map<std::string, size_t> groups_per_language;
    size_t total_groups = 0;
};

class DuplicateGlossFinder {
public:
    /**
     * @throws std::invalid_argument if `dictionary` is not a JSON object
     */
    static DuplicateReport find(const nlohmann::json& dictionary);

    static std::string format_key(const std::string& gloss, bool is_old, const nlohmann::json& semantics);
};

} // namespace Bliss
