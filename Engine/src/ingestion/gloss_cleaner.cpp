#include <ingestion/gloss_cleaner.hpp>
#include <map>
#include <stdexcept>

namespace Bliss {

// Symbol that turns an abstract meaning into a concrete one.
static constexpr int kConcretizationSymbol = 9009;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static const std::map<SymbolId, std::vector<std::string>>& special_gloss_table() {
    static const std::map<SymbolId, std::vector<std::string>> table = [] {
        std::map<SymbolId, std::vector<std::string>> t = {
            {"8483", {"!"}}, {"8484", {"%"}}, {"8485", {"?"}}, {"8486", {"."}},
            {"8487", {","}}, {"8488", {":"}}, {"8489", {"'"}}, {"8490", {"degree"}},
        };
        for (int d = 0; d < 10; ++d) {
            t[std::to_string(8496 + d)] = {std::string(1, static_cast<char>('0' + d))};
        }
        for (int c = 0; c < 26; ++c) {
            t[std::to_string(8521 + c)] = {std::string(1, static_cast<char>('a' + c))};
            t[std::to_string(8551 + c)] = {std::string(1, static_cast<char>('A' + c))};
        }
        return t;
    }();
    return table;
}

const std::vector<std::string>* GlossCleaner::special_glosses(const SymbolId& id) {
    const auto& table = special_gloss_table();
    auto it = table.find(id);
    return it == table.end() ? nullptr : &it->second;
}

std::vector<std::string> GlossCleaner::expand_plural(const std::string& text) {
    static const std::string marker = "(s)";
    if (text.size() > marker.size() && ends_with(text, marker)) {
        std::string base = text.substr(0, text.size() - marker.size());
        return {base, base + "s"};
    }
    return {text};
}

CleanedGlosses GlossCleaner::clean_description(const std::string& raw) {
    CleanedGlosses out;
    if (raw.empty()) return out;

    std::string text = raw;
    if (ends_with(text, "_(OLD)")) {
        text.resize(text.size() - 6);
        out.is_old = true;
    }
    if (ends_with(text, "-(to)")) {
        text.resize(text.size() - 5);
    }
    for (char& c : text) {
        if (c == '_') c = ' ';
    }

    // Trailing context group: "(...)" at the end, opened after a space or at
    // the start. "(s)" glued to a word is a plural marker, not context.
    std::string context;
    if (!text.empty() && text.back() == ')') {
        int depth = 0;
        size_t open = std::string::npos;
        for (size_t i = text.size(); i-- > 0; ) {
            if (text[i] == ')') ++depth;
            else if (text[i] == '(' && --depth == 0) { open = i; break; }
        }
        if (open != std::string::npos && (open == 0 || text[open - 1] == ' ')) {
            context = " " + trim(text.substr(open));
            text = trim(text.substr(0, open));
        }
    }

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string part = trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!part.empty()) {
            for (const auto& g : expand_plural(part)) {
                out.glosses.push_back(g + context);
            }
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

static bool has_concretization(const nlohmann::json& item) {
    if (!item.contains("composition") || !item["composition"].is_array()) return false;
    for (const auto& part : item["composition"]) {
        if (part.is_number_integer() && part.get<long long>() == kConcretizationSymbol) return true;
        if (part.is_string() && part.get<std::string>() == std::to_string(kConcretizationSymbol)) return true;
    }
    return false;
}

nlohmann::json GlossCleaner::clean_record(const SymbolId& id, const nlohmann::json& item) {
    nlohmann::json out = item;
    out.erase("description");

    nlohmann::json glosses = nlohmann::json::object();
    bool is_old = false;

    if (item.contains("description") && item["description"].is_object()) {
        for (const auto& [lang, value] : item["description"].items()) {
            std::vector<std::string> cleaned;
            const auto* special = lang == "en" ? special_glosses(id) : nullptr;
            if (special) {
                cleaned = *special;
            } else if (value.is_string()) {
                CleanedGlosses c = clean_description(value.get<std::string>());
                cleaned = std::move(c.glosses);
                is_old = is_old || c.is_old;
            }
            if (!cleaned.empty()) glosses[lang] = cleaned;
        }
    }
    out["glosses"] = glosses;
    if (is_old) out["is_old"] = true;

    nlohmann::json semantics = nlohmann::json::object();
    const std::string pos = item.value("pos", std::string());
    if (pos == "RED") {
        semantics["POS"] = "verb";
    } else if (pos == "YELLOW" || pos == "BLUE") {
        semantics["POS"] = "noun";
    }
    if (has_concretization(item)) {
        semantics["TYPE_SHIFT"] = "concretization";
    }
    if (!semantics.empty()) out["semantics"] = semantics;

    return out;
}

nlohmann::json GlossCleaner::clean_dictionary(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw std::invalid_argument("Raw Bliss dictionary must be a JSON object keyed by symbol id");
    }
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [id, item] : raw.items()) {
        out[id] = item.is_object() ? clean_record(id, item) : item;
    }
    return out;
}

} // namespace Bliss
