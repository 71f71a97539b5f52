/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the director configuration (director.json).
 *
 * Provides a unified way to access backend, model and pacing settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DirectorConfig.hpp"

namespace dreadloom::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads director.json.
     * @param configPath File to read; empty selects PathUtils::GetDefaultConfigFile().
     * @return The parsed config, or defaults when the file is missing or unreadable.
     */
    static domain::DirectorConfig Load(const std::filesystem::path& configPath = {});

    /**
     * @brief Writes @p config to director.json, preserving unknown keys if possible.
     * @return False if the file could not be written.
     */
    static bool Save(const domain::DirectorConfig& config, const std::filesystem::path& configPath = {});

    /** @brief Overlays the keys present in @p j onto defaults. Throws nlohmann::json::exception on type errors. */
    static domain::DirectorConfig FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::DirectorConfig& config);

private:
    static std::filesystem::path Resolve(const std::filesystem::path& configPath);
};

} // namespace dreadloom::infrastructure
