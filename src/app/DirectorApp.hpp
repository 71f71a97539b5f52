/**
 * @file DirectorApp.hpp
 * @brief Headless console host for a director session.
 */

#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "application/Director.hpp"

namespace dreadloom::app {

/**
 * @class DirectorApp
 * @brief Orchestrates the session lifecycle: initialization, the fixed-step loop, and shutdown.
 *
 * Commands are read line by line from stdin:
 *   <choice_type> <target>             record a player action
 *   room <archetype> <level> <theme>   describe a room
 *   analyze                            request a trait analysis
 *   image <description>                generate and save a still
 *   status                             print the profile summary and tension
 *   quit
 */
class DirectorApp {
public:
    /**
     * @brief Starts the session main loop.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads configuration and builds the director.
     * @return True if initialization succeeded.
     */
    bool Init(int argc, char** argv);

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    void ReadInput();
    bool HandleCommand(const std::string& line);
    void SaveImage(const domain::ImageResult& image);

    std::unique_ptr<application::Director> m_director; ///< Session composition root.
    std::filesystem::path m_configPath;                ///< Empty selects the XDG default.
    int m_tickHz = 30;

    std::mutex m_inputMutex;
    std::deque<std::string> m_pendingLines;  ///< Lines read but not yet handled.
    std::atomic<bool> m_inputClosed{false};
    std::atomic<int> m_imageCounter{0};
};

} // namespace dreadloom::app
