/**
 * @file symbol_record.hpp
 * @brief Blissymbolics symbol model: ids, colour-coded POS, dictionary records
 */

#pragma once

#include <lexicon/semantic_descriptor.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace Bliss {

/// Decimal symbol id kept as text ("14905"), the key into the dictionary.
using SymbolId = std::string;

/**
 * @brief Colour-coded part-of-speech category of a symbol.
 *
 * Yellow, Red, Green and Blue symbols carry a head meaning and may act as
 * classifiers. Grey and White symbols are grammatical satellites.
 */
enum class PosCategory {
    Yellow,
    Red,
    Green,
    Blue,
    Grey,
    White,
    Unknown
};

PosCategory parse_pos(const std::string& name);
const char* pos_name(PosCategory pos);

inline bool is_head_bearing(PosCategory pos) {
    return pos == PosCategory::Yellow || pos == PosCategory::Red ||
           pos == PosCategory::Green || pos == PosCategory::Blue;
}

inline bool is_satellite(PosCategory pos) {
    return pos == PosCategory::Grey || pos == PosCategory::White;
}

/**
 * @brief True for a non-empty, all-digit token. Anything else is a rendering marker.
 */
bool is_symbol_id(const std::string& token);

/**
 * @brief Immutable dictionary entry for one symbol.
 */
struct SymbolRecord {
    SymbolId id;
    PosCategory pos = PosCategory::Unknown;
    bool is_character = false;
    bool is_old = false;
    std::map<std::string, std::vector<std::string>> glosses;  // language -> glosses
    std::string explanation;
    std::optional<SemanticDescriptor> semantic_effect;

    /**
     * @brief Glosses for a language, or nullptr when the language is absent.
     */
    const std::vector<std::string>* glosses_for(const std::string& language) const {
        auto it = glosses.find(language);
        return it == glosses.end() ? nullptr : &it->second;
    }
};

} // namespace Bliss
