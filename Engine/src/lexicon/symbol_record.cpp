#include <lexicon/symbol_record.hpp>
#include <algorithm>
#include <cctype>

namespace Bliss {

PosCategory parse_pos(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "YELLOW") return PosCategory::Yellow;
    if (upper == "RED")    return PosCategory::Red;
    if (upper == "GREEN")  return PosCategory::Green;
    if (upper == "BLUE")   return PosCategory::Blue;
    if (upper == "GREY" || upper == "GRAY") return PosCategory::Grey;
    if (upper == "WHITE")  return PosCategory::White;
    return PosCategory::Unknown;
}

const char* pos_name(PosCategory pos) {
    switch (pos) {
        case PosCategory::Yellow: return "YELLOW";
        case PosCategory::Red:    return "RED";
        case PosCategory::Green:  return "GREEN";
        case PosCategory::Blue:   return "BLUE";
        case PosCategory::Grey:   return "GREY";
        case PosCategory::White:  return "WHITE";
        case PosCategory::Unknown: break;
    }
    return "unknown";
}

bool is_symbol_id(const std::string& token) {
    if (token.empty()) return false;
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return c >= '0' && c <= '9'; });
}

} // namespace Bliss
