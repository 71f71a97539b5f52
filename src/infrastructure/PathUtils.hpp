// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace dreadloom::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/dreadloom/director.json (not created). */
    static std::filesystem::path GetDefaultConfigFile();

    /** @brief $XDG_DATA_HOME/dreadloom/images, created on demand. */
    static std::filesystem::path GetImagesDir();
};

} // namespace dreadloom::infrastructure
