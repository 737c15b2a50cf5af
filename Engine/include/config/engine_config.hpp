#pragma once

#include <utils/logger.hpp>
#include <string>
#include <stdexcept>
#include <cstdlib>

namespace Bliss {

/**
 * @brief Runtime configuration, read from the environment.
 *
 *   BLISS_DICT_PATH       cleaned dictionary JSON (required)
 *   BLISS_SEMANTICS_PATH  modifier/indicator tables JSON (required)
 *   BLISS_LANGUAGE        default gloss language, "en" if unset
 *   BLISS_LOG_LEVEL       info | warning | error | quiet
 */
struct EngineConfig {
    std::string dictionary_path;
    std::string semantics_path;
    std::string language = "en";
    Logger::Level log_level = Logger::Level::Info;

    /**
     * @brief Every BLISS_* variable that is set; missing ones keep their defaults.
     */
    static EngineConfig read_env() {
        EngineConfig config;

        const char* dict_env = std::getenv("BLISS_DICT_PATH");
        const char* sem_env = std::getenv("BLISS_SEMANTICS_PATH");
        const char* lang_env = std::getenv("BLISS_LANGUAGE");
        const char* log_env = std::getenv("BLISS_LOG_LEVEL");

        if (dict_env) config.dictionary_path = dict_env;
        if (sem_env) config.semantics_path = sem_env;
        if (lang_env && *lang_env) config.language = lang_env;
        if (log_env) config.log_level = Logger::parse_level(log_env);

        return config;
    }

    /**
     * @throws std::runtime_error naming the variable of the first missing path
     */
    void require_paths() const {
        if (dictionary_path.empty())
            throw std::runtime_error("BLISS_DICT_PATH environment variable is not set.");
        if (semantics_path.empty())
            throw std::runtime_error("BLISS_SEMANTICS_PATH environment variable is not set.");
    }

    static EngineConfig load_from_env() {
        EngineConfig config = read_env();
        config.require_paths();
        return config;
    }
};

} // namespace Bliss
