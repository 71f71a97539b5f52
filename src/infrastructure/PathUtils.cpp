#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace dreadloom::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / "dreadloom" / "director.json";
}

fs::path PathUtils::GetImagesDir() {
    fs::path base = GetDataHome() / "dreadloom" / "images";
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
        }
    }
    return base;
}

} // namespace dreadloom::infrastructure
