#include <lexicon/semantic_tables.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <stdexcept>

namespace Bliss {

SemanticTables::SemanticTables(Table modifiers, Table indicators)
    : modifiers_(std::move(modifiers)), indicators_(std::move(indicators)) {
    for (const auto& [id, descriptor] : modifiers_) {
        if (indicators_.count(id)) {
            throw std::invalid_argument("Symbol " + id + " is listed as both modifier and indicator");
        }
    }
}

static SemanticTables::Table table_from_json(const nlohmann::json& j, const char* name) {
    SemanticTables::Table table;
    if (!j.contains(name)) return table;

    const auto& section = j[name];
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("Semantic table \"") + name + "\" must be a JSON object");
    }
    for (const auto& [id, descriptor] : section.items()) {
        if (!is_symbol_id(id)) {
            throw std::invalid_argument(std::string("Semantic table \"") + name + "\" has non-numeric id: " + id);
        }
        table.emplace(id, descriptor_from_json(descriptor));
    }
    return table;
}

SemanticTables SemanticTables::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Semantic tables must be a JSON object with \"modifiers\" and \"indicators\"");
    }
    return SemanticTables(table_from_json(j, "modifiers"), table_from_json(j, "indicators"));
}

SemanticTables SemanticTables::load_file(const std::filesystem::path& path) {
    Logger::step("Loading semantic tables: " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open semantic tables file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid semantic tables JSON in " + path.string() + ": " + e.what());
    }

    SemanticTables tables = from_json(json);
    Logger::success("Loaded " + std::to_string(tables.modifiers().size()) + " modifiers, " +
                    std::to_string(tables.indicators().size()) + " indicators");
    return tables;
}

const SemanticDescriptor* SemanticTables::find(const SymbolId& id, SymbolRole role) const {
    const Table& table = table_for(role);
    auto it = table.find(id);
    return it == table.end() ? nullptr : &it->second;
}

nlohmann::json SemanticTables::to_json() const {
    nlohmann::json out = {{"modifiers", nlohmann::json::object()}, {"indicators", nlohmann::json::object()}};
    for (const auto& [id, d] : modifiers_) out["modifiers"][id] = descriptor_to_json(d);
    for (const auto& [id, d] : indicators_) out["indicators"][id] = descriptor_to_json(d);
    return out;
}

} // namespace Bliss
