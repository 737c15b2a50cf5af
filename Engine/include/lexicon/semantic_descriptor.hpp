/**
 * @file semantic_descriptor.hpp
 * @brief Structured semantic facts contributed by indicator and modifier symbols
 *
 * A descriptor is one of three closed shapes:
 * - SimpleSemantic:       {"type": "NUMBER", "value": "plural"}
 * - AlternativeSemantics: {"or":  [{...}, {...}]}  any one option may be meant
 * - CombinedSemantics:    {"and": [{...}, {...}]}  all parts apply at once
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <variant>

namespace Bliss {

struct SemanticPair {
    std::string type;   // e.g. "NUMBER", "QUANTIFIER", "POS"
    std::string value;  // e.g. "plural", "many"

    bool operator==(const SemanticPair& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const SemanticPair& other) const { return !(*this == other); }

    /// "TYPE:value", the key of the semantic-path index.
    std::string path() const { return type + ":" + value; }
};

struct SimpleSemantic {
    SemanticPair pair;
};

struct AlternativeSemantics {
    std::vector<SemanticPair> options;
};

struct CombinedSemantics {
    std::vector<SemanticPair> parts;
};

using SemanticDescriptor = std::variant<SimpleSemantic, AlternativeSemantics, CombinedSemantics>;

/// Visitor helper for std::visit over SemanticDescriptor.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @brief Parse a descriptor from its table JSON form.
 * @throws std::invalid_argument if the object has none of the three shapes
 */
SemanticDescriptor descriptor_from_json(const nlohmann::json& j);

nlohmann::json descriptor_to_json(const SemanticDescriptor& descriptor);

/**
 * @brief Does the descriptor carry {type, value}?
 *
 * Type is compared exactly, value case-insensitively. Simple pairs, any
 * alternative option and any combined part all count as a match.
 */
bool descriptor_matches(const SemanticDescriptor& descriptor,
                        const std::string& type, const std::string& value);

} // namespace Bliss
