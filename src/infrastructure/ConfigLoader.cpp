/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>

namespace dreadloom::infrastructure {

using json = nlohmann::json;

std::filesystem::path ConfigLoader::Resolve(const std::filesystem::path& configPath) {
    return configPath.empty() ? PathUtils::GetDefaultConfigFile() : configPath;
}

domain::DirectorConfig ConfigLoader::FromJson(const json& j) {
    domain::DirectorConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("backend") && j["backend"].is_object()) {
        const auto& b = j["backend"];
        auto& backend = config.backend;
        backend.host = b.value("host", backend.host);
        backend.port = b.value("port", backend.port);
        backend.path = b.value("path", backend.path);
        backend.imagePath = b.value("image_path", backend.imagePath);
        backend.modelsPath = b.value("models_path", backend.modelsPath);
        backend.useTls = b.value("use_tls", backend.useTls);
        backend.apiKeyEnv = b.value("api_key_env", backend.apiKeyEnv);
        backend.readTimeoutSeconds = b.value("read_timeout_s", backend.readTimeoutSeconds);
    }

    if (j.contains("models") && j["models"].is_object()) {
        for (const auto& [key, value] : j["models"].items()) {
            if (key == "default") {
                config.defaultModel = value.get<std::string>();
            } else {
                config.models[key] = value.get<std::string>();
            }
        }
    }

    if (j.contains("temperatures") && j["temperatures"].is_object()) {
        for (const auto& [key, value] : j["temperatures"].items()) {
            config.temperatures[key] = value.get<float>();
        }
    }

    if (j.contains("tension") && j["tension"].is_object()) {
        const auto& t = j["tension"];
        config.decayRate = t.value("decay_rate", config.decayRate);
        if (t.contains("seed") && !t["seed"].is_null()) {
            config.seed = t["seed"].get<unsigned int>();
        }
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        config.maxRelevantMemories = j["memory"].value("max_relevant", config.maxRelevantMemories);
    }

    config.tickHz = j.value("tick_hz", config.tickHz);
    if (config.tickHz <= 0) {
        std::cerr << "[ConfigLoader] Ignoring non-positive tick_hz." << std::endl;
        config.tickHz = domain::DirectorConfig().tickHz;
    }

    return config;
}

json ConfigLoader::ToJson(const domain::DirectorConfig& config) {
    const auto& backend = config.backend;
    json j = {
        {"backend", {
            {"host", backend.host},
            {"port", backend.port},
            {"path", backend.path},
            {"image_path", backend.imagePath},
            {"models_path", backend.modelsPath},
            {"use_tls", backend.useTls},
            {"api_key_env", backend.apiKeyEnv},
            {"read_timeout_s", backend.readTimeoutSeconds}
        }},
        {"memory", {{"max_relevant", config.maxRelevantMemories}}},
        {"tick_hz", config.tickHz}
    };

    json models = json::object();
    if (!config.defaultModel.empty()) {
        models["default"] = config.defaultModel;
    }
    for (const auto& [context, model] : config.models) {
        models[context] = model;
    }
    j["models"] = models;

    json temperatures = json::object();
    for (const auto& [context, temperature] : config.temperatures) {
        temperatures[context] = temperature;
    }
    j["temperatures"] = temperatures;

    j["tension"] = {{"decay_rate", config.decayRate}};
    if (config.seed) {
        j["tension"]["seed"] = *config.seed;
    }
    return j;
}

domain::DirectorConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    std::filesystem::path path = Resolve(configPath);
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] No config at " << path << "; using defaults." << std::endl;
        return domain::DirectorConfig();
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        auto config = FromJson(j);
        std::cout << "[ConfigLoader] Loaded " << path << std::endl;
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return domain::DirectorConfig();
}

bool ConfigLoader::Save(const domain::DirectorConfig& config, const std::filesystem::path& configPath) {
    std::filesystem::path path = Resolve(configPath);
    json j = json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing " << path << " unreadable, overwriting: " << e.what() << std::endl;
            j = json::object();
        }
    }
    if (!j.is_object()) {
        j = json::object();
    }
    j.merge_patch(ToJson(config));

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << path << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace dreadloom::infrastructure
