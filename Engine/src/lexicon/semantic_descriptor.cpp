#include <lexicon/semantic_descriptor.hpp>
#include <utils/unicode.hpp>
#include <stdexcept>

namespace Bliss {

static SemanticPair pair_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j.contains("value") ||
        !j["type"].is_string() || !j["value"].is_string()) {
        throw std::invalid_argument("Semantic pair must be {\"type\": ..., \"value\": ...}, got: " + j.dump());
    }
    return SemanticPair{j["type"].get<std::string>(), j["value"].get<std::string>()};
}

static std::vector<SemanticPair> pair_list_from_json(const nlohmann::json& j, const char* key) {
    if (!j.is_array()) {
        throw std::invalid_argument(std::string("Semantic \"") + key + "\" entry must be an array");
    }
    std::vector<SemanticPair> pairs;
    pairs.reserve(j.size());
    for (const auto& item : j) {
        pairs.push_back(pair_from_json(item));
    }
    return pairs;
}

static nlohmann::json pair_list_to_json(const std::vector<SemanticPair>& pairs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : pairs) {
        arr.push_back(nlohmann::json{{"type", p.type}, {"value", p.value}});
    }
    return arr;
}

SemanticDescriptor descriptor_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Semantic descriptor must be a JSON object, got: " + j.dump());
    }
    if (j.contains("or")) {
        return AlternativeSemantics{pair_list_from_json(j["or"], "or")};
    }
    if (j.contains("and")) {
        return CombinedSemantics{pair_list_from_json(j["and"], "and")};
    }
    if (j.contains("type") && j.contains("value")) {
        return SimpleSemantic{pair_from_json(j)};
    }
    throw std::invalid_argument("Unrecognised semantic descriptor shape: " + j.dump());
}

nlohmann::json descriptor_to_json(const SemanticDescriptor& descriptor) {
    return std::visit(overloaded{
        [](const SimpleSemantic& s) -> nlohmann::json {
            return {{"type", s.pair.type}, {"value", s.pair.value}};
        },
        [](const AlternativeSemantics& a) -> nlohmann::json {
            return {{"or", pair_list_to_json(a.options)}};
        },
        [](const CombinedSemantics& c) -> nlohmann::json {
            return {{"and", pair_list_to_json(c.parts)}};
        }
    }, descriptor);
}

bool descriptor_matches(const SemanticDescriptor& descriptor,
                        const std::string& type, const std::string& value) {
    const std::string wanted = to_lower_utf8(value);
    auto hit = [&](const SemanticPair& p) {
        return p.type == type && to_lower_utf8(p.value) == wanted;
    };
    auto any_hit = [&](const std::vector<SemanticPair>& pairs) {
        for (const auto& p : pairs) {
            if (hit(p)) return true;
        }
        return false;
    };

    return std::visit(overloaded{
        [&](const SimpleSemantic& s) { return hit(s.pair); },
        [&](const AlternativeSemantics& a) { return any_hit(a.options); },
        [&](const CombinedSemantics& c) { return any_hit(c.parts); }
    }, descriptor);
}

} // namespace Bliss
