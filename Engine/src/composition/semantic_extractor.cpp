#include <composition/semantic_extractor.hpp>

namespace Bliss {

nlohmann::json SemanticFact::to_json() const {
    nlohmann::json j = {{"symbol_id", symbol_id}};
    const char* role_key = role_name(role);

    std::visit(overloaded{
        [&](const SimpleSemantic& s) {
            j[role_key] = {{s.pair.type, s.pair.value}};
        },
        [&](const AlternativeSemantics&) {
            j["type"] = role_key;
            j["alternatives"] = descriptor_to_json(descriptor)["or"];
        },
        [&](const CombinedSemantics&) {
            j["type"] = role_key;
            j["combined"] = descriptor_to_json(descriptor)["and"];
        }
    }, descriptor);
    return j;
}

std::optional<SemanticFact> SemanticExtractor::extract(const SymbolId& id, SymbolRole role) const {
    const SemanticDescriptor* d = tables_.find(id, role);
    if (!d) return std::nullopt;
    return SemanticFact{id, role, *d};
}

} // namespace Bliss
