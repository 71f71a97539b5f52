/**
 * @file DirectorConfig.hpp
 * @brief Plain configuration values for a director session.
 */

#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace dreadloom::domain {

/**
 * @struct BackendSettings
 * @brief Where and how to reach the generation service.
 */
struct BackendSettings {
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/v1/completions";
    std::string imagePath = "/v1/images/generations";
    std::string modelsPath = "/v1/models";
    bool useTls = false;
    std::string apiKeyEnv = "DREADLOOM_API_KEY"; ///< Name of the env var holding the bearer token.
    int readTimeoutSeconds = 120;
};

/**
 * @struct DirectorConfig
 * @brief Everything loaded from director.json. Every field has a usable default.
 */
struct DirectorConfig {
    BackendSettings backend;
    std::string defaultModel;                     ///< Empty lets the backend choose.
    std::map<std::string, std::string> models;    ///< contextType -> model.
    std::map<std::string, float> temperatures;    ///< contextType -> override.
    float decayRate = 0.02f;
    std::optional<unsigned int> seed;             ///< Fixed scheduler seed for reproducible runs.
    std::size_t maxRelevantMemories = 3;
    int tickHz = 30;
};

} // namespace dreadloom::domain
