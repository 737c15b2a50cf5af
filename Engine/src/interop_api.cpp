#include <interop_api.h>
#include <engine/bliss_engine.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using Bliss::BlissEngine;

// Thread-local error storage
thread_local std::string g_last_error;

const char* bliss_get_last_error() {
    return g_last_error.c_str();
}

const char* bliss_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Released with bliss_string_free (free)
static char* strdup_safe(const std::string& str) {
    char* out = static_cast<char*>(std::malloc(str.size() + 1));
    if (!out) throw std::bad_alloc();
    std::memcpy(out, str.c_str(), str.size() + 1);
    return out;
}

static BlissEngine& engine_of(h_bliss_engine_t handle) {
    if (!handle) throw std::invalid_argument("Null engine handle");
    return *static_cast<BlissEngine*>(handle);
}

static std::string require_text(const char* s, const char* what) {
    if (!s) throw std::invalid_argument(std::string("Null ") + what);
    return std::string(s);
}

// JSON array of ids; integers are accepted and rendered as decimal text.
static std::vector<std::string> parse_id_list(const char* json_text) {
    std::vector<std::string> ids;
    if (!json_text || !*json_text) return ids;

    auto json = nlohmann::json::parse(json_text);
    if (!json.is_array()) throw std::invalid_argument("Expected a JSON array of symbol ids");
    for (const auto& item : json) {
        if (item.is_string()) ids.push_back(item.get<std::string>());
        else if (item.is_number_integer()) ids.push_back(std::to_string(item.get<long long>()));
        else ids.push_back(item.dump());
    }
    return ids;
}

// =============================================================================
//  Engine Lifecycle
// =============================================================================

h_bliss_engine_t bliss_engine_create(const char* dictionary_path, const char* semantics_path) {
    INTEROP_TRY_CATCH_PTR({
        Bliss::EngineConfig config;
        config.dictionary_path = require_text(dictionary_path, "dictionary path");
        config.semantics_path = require_text(semantics_path, "semantics path");
        config.log_level = Bliss::Logger::min_level();
        return static_cast<h_bliss_engine_t>(BlissEngine::from_config(config).release());
    })
}

h_bliss_engine_t bliss_engine_create_from_json(const char* dictionary_json, const char* semantics_json) {
    INTEROP_TRY_CATCH_PTR({
        auto dict = nlohmann::json::parse(require_text(dictionary_json, "dictionary JSON"));
        auto tables = nlohmann::json::parse(require_text(semantics_json, "semantics JSON"));
        auto* engine = new BlissEngine(dict, tables);
        return static_cast<h_bliss_engine_t>(engine);
    })
}

void bliss_engine_destroy(h_bliss_engine_t handle) {
    if (handle) {
        delete static_cast<BlissEngine*>(handle);
    }
}

// =============================================================================
//  Queries
// =============================================================================

char* bliss_symbol_glosses(h_bliss_engine_t handle, const char* symbol_id, const char* language) {
    INTEROP_TRY_CATCH_PTR({
        auto& engine = engine_of(handle);
        auto result = engine.symbol_glosses(require_text(symbol_id, "symbol id"), language ? language : "en");
        return strdup_safe(result.to_json().dump());
    })
}

char* bliss_classify(h_bliss_engine_t handle, const char* composition_json) {
    INTEROP_TRY_CATCH_PTR({
        auto& engine = engine_of(handle);
        return strdup_safe(engine.classify(parse_id_list(composition_json)).to_json().dump());
    })
}

char* bliss_analyze(h_bliss_engine_t handle, const char* composition_json, const char* language) {
    INTEROP_TRY_CATCH_PTR({
        auto& engine = engine_of(handle);
        auto analysis = engine.analyze_composition(parse_id_list(composition_json), language ? language : "en");
        return strdup_safe(analysis.to_json().dump());
    })
}

char* bliss_compose(h_bliss_engine_t handle, const char* spec_json) {
    INTEROP_TRY_CATCH_PTR({
        auto& engine = engine_of(handle);
        auto spec = nlohmann::json::parse(require_text(spec_json, "spec JSON"));
        return strdup_safe(engine.compose_from_spec(spec).to_json().dump());
    })
}

char* bliss_compose_with_ids(h_bliss_engine_t handle, const char* classifier_id,
                             const char* specifiers_json, const char* modifiers_json,
                             const char* indicators_json) {
    INTEROP_TRY_CATCH_PTR({
        auto& engine = engine_of(handle);
        auto result = engine.compose_with_ids(require_text(classifier_id, "classifier id"),
                                              parse_id_list(specifiers_json),
                                              parse_id_list(modifiers_json),
                                              parse_id_list(indicators_json));
        return strdup_safe(result.to_json().dump());
    })
}

bool bliss_is_classifier(h_bliss_engine_t handle, const char* symbol_id) {
    INTEROP_TRY_CATCH({
        return engine_of(handle).is_classifier(require_text(symbol_id, "symbol id"));
    })
}

bool bliss_is_modifier(h_bliss_engine_t handle, const char* symbol_id) {
    INTEROP_TRY_CATCH({
        return engine_of(handle).is_modifier(require_text(symbol_id, "symbol id"));
    })
}

bool bliss_is_indicator(h_bliss_engine_t handle, const char* symbol_id) {
    INTEROP_TRY_CATCH({
        return engine_of(handle).is_indicator(require_text(symbol_id, "symbol id"));
    })
}

void bliss_string_free(char* str) {
    std::free(str);
}
