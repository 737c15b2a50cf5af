#pragma once

#include <export.hpp>

#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
BLISS_API const char* bliss_get_last_error();
BLISS_API const char* bliss_get_version();

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* h_bliss_engine_t;

// =============================================================================
//  Engine Lifecycle
// =============================================================================

// Load from a dictionary JSON file and a semantic tables JSON file.
BLISS_API h_bliss_engine_t bliss_engine_create(const char* dictionary_path, const char* semantics_path);

// Build from in-memory JSON documents.
BLISS_API h_bliss_engine_t bliss_engine_create_from_json(const char* dictionary_json, const char* semantics_json);

BLISS_API void bliss_engine_destroy(h_bliss_engine_t handle);

// =============================================================================
//  Queries
//
//  Every query returns a heap-allocated, NUL-terminated JSON document that
//  the caller releases with bliss_string_free(), or NULL on failure (see
//  bliss_get_last_error()). Compositions are passed as JSON arrays of ids.
// =============================================================================

BLISS_API char* bliss_symbol_glosses(h_bliss_engine_t handle, const char* symbol_id, const char* language);
BLISS_API char* bliss_classify(h_bliss_engine_t handle, const char* composition_json);
BLISS_API char* bliss_analyze(h_bliss_engine_t handle, const char* composition_json, const char* language);
BLISS_API char* bliss_compose(h_bliss_engine_t handle, const char* spec_json);
BLISS_API char* bliss_compose_with_ids(h_bliss_engine_t handle, const char* classifier_id,
                                       const char* specifiers_json, const char* modifiers_json,
                                       const char* indicators_json);

BLISS_API bool bliss_is_classifier(h_bliss_engine_t handle, const char* symbol_id);
BLISS_API bool bliss_is_modifier(h_bliss_engine_t handle, const char* symbol_id);
BLISS_API bool bliss_is_indicator(h_bliss_engine_t handle, const char* symbol_id);

BLISS_API void bliss_string_free(char* str);

#ifdef __cplusplus
}
#endif
