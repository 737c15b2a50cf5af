#include <ingestion/duplicate_glosses.hpp>
#include <lexicon/symbol_record.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Bliss {

// (is_old, canonical semantics JSON); nlohmann objects dump with sorted keys
using MetaSignature = std::pair<bool, std::string>;

static MetaSignature meta_signature(const nlohmann::json& item) {
    bool is_old = item.value("is_old", false);
    nlohmann::json semantics = item.contains("semantics") ? item["semantics"] : nlohmann::json::object();
    return {is_old, semantics.dump()};
}

// Numeric ids in numeric order, anything else after them
static bool id_less(const std::string& a, const std::string& b) {
    const bool na = is_symbol_id(a), nb = is_symbol_id(b);
    if (na != nb) return na;
    if (na && a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

static std::string value_text(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

std::string DuplicateGlossFinder::format_key(const std::string& gloss, bool is_old,
                                             const nlohmann::json& semantics) {
    std::vector<std::string> extras;
    if (is_old) extras.push_back("OLD");
    if (semantics.is_object()) {
        for (const auto& [key, value] : semantics.items()) {
            extras.push_back(key + ": " + value_text(value));
        }
    }
    if (extras.empty()) return gloss;

    std::string out = gloss + " (";
    for (size_t i = 0; i < extras.size(); ++i) {
        if (i) out += ", ";
        out += extras[i];
    }
    return out + ")";
}

DuplicateReport DuplicateGlossFinder::find(const nlohmann::json& dictionary) {
    if (!dictionary.is_object()) {
        throw std::invalid_argument("Bliss dictionary must be a JSON object keyed by symbol id");
    }

    // lang -> gloss -> signature -> ids
    std::map<std::string, std::map<std::string, std::map<MetaSignature, std::vector<std::string>>>> grouped;

    for (const auto& [id, item] : dictionary.items()) {
        if (!item.is_object() || !item.contains("glosses") || !item["glosses"].is_object()) continue;
        const MetaSignature sig = meta_signature(item);

        for (const auto& [lang, list] : item["glosses"].items()) {
            if (!list.is_array()) continue;
            for (const auto& gloss : list) {
                if (!gloss.is_string()) continue;
                grouped[lang][gloss.get<std::string>()][sig].push_back(id);
            }
        }
    }

    DuplicateReport report;
    for (auto& [lang, gloss_map] : grouped) {
        nlohmann::json lang_groups = nlohmann::json::object();
        for (auto& [gloss, by_sig] : gloss_map) {
            for (auto& [sig, ids] : by_sig) {
                if (ids.size() < 2) continue;
                std::sort(ids.begin(), ids.end(), id_less);
                lang_groups[format_key(gloss, sig.first, nlohmann::json::parse(sig.second))] = ids;
                ++report.total_groups;
            }
        }
        if (!lang_groups.empty()) {
            report.groups_per_language[lang] = lang_groups.size();
            report.groups[lang] = std::move(lang_groups);
        }
    }
    return report;
}

} // namespace Bliss
