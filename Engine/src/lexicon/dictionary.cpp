#include <lexicon/dictionary.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <stdexcept>

namespace Bliss {

Dictionary::Dictionary(Map symbols) : symbols_(std::move(symbols)) {}

// The cleaning pipeline writes semantics as {"POS": "noun", ...}; semantic
// tables use {"type": .., "value": ..} / {"or": ..} / {"and": ..}. Accept both.
static std::optional<SemanticDescriptor> effect_from_json(const SymbolId& id, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Symbol " + id + ": semantics must be an object");
    }
    if (j.contains("or") || j.contains("and") || (j.contains("type") && j.contains("value"))) {
        return descriptor_from_json(j);
    }

    std::vector<SemanticPair> pairs;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            throw std::invalid_argument("Symbol " + id + ": semantic value for " + key + " must be a string");
        }
        pairs.push_back(SemanticPair{key, value.get<std::string>()});
    }

    if (pairs.empty()) return std::nullopt;
    if (pairs.size() == 1) return SimpleSemantic{pairs.front()};
    return CombinedSemantics{std::move(pairs)};
}

SymbolRecord record_from_json(const SymbolId& id, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Symbol " + id + ": record must be a JSON object");
    }

    SymbolRecord rec;
    rec.id = id;
    rec.pos = parse_pos(j.value("pos", std::string()));
    rec.is_character = j.value("isCharacter", false);
    rec.is_old = j.value("is_old", false);
    rec.explanation = j.value("explanation", std::string());

    if (j.contains("glosses") && j["glosses"].is_object()) {
        for (const auto& [lang, list] : j["glosses"].items()) {
            std::vector<std::string> glosses;
            if (list.is_array()) {
                for (const auto& g : list) {
                    if (g.is_string()) glosses.push_back(g.get<std::string>());
                }
            } else if (list.is_string()) {
                glosses.push_back(list.get<std::string>());
            }
            rec.glosses.emplace(lang, std::move(glosses));
        }
    }

    if (j.contains("semantics") && !j["semantics"].is_null()) {
        rec.semantic_effect = effect_from_json(id, j["semantics"]);
    }

    return rec;
}

Dictionary Dictionary::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Bliss dictionary must be a JSON object keyed by symbol id");
    }

    Map symbols;
    for (const auto& [id, node] : j.items()) {
        symbols.emplace(id, record_from_json(id, node));
    }
    return Dictionary(std::move(symbols));
}

Dictionary Dictionary::load_file(const std::filesystem::path& path) {
    Logger::step("Loading dictionary: " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open dictionary file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid dictionary JSON in " + path.string() + ": " + e.what());
    }

    Dictionary dict = from_json(json);
    Logger::success("Loaded " + std::to_string(dict.size()) + " symbols");
    return dict;
}

const SymbolRecord* Dictionary::find(const SymbolId& id) const {
    auto it = symbols_.find(id);
    return it == symbols_.end() ? nullptr : &it->second;
}

DictionaryStats Dictionary::stats() const {
    DictionaryStats s;
    s.symbols = symbols_.size();
    for (const auto& [id, rec] : symbols_) {
        if (rec.is_character) ++s.characters;
        else ++s.composed_words;
    }
    return s;
}

} // namespace Bliss
