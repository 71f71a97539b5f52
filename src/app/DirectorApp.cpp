/**
 * @file DirectorApp.cpp
 * @brief Implementation of the DirectorApp class.
 */
#include "app/DirectorApp.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include "application/DirectorContext.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpGenerationClient.hpp"
#include "infrastructure/PathUtils.hpp"

namespace dreadloom::app {

namespace {

void PrintUsage() {
    std::cout << "Usage: dreadloom [--config <director.json>] [--save-config]\n"
              << "Commands: <choice> <target> | room <archetype> <level> <theme> | analyze | "
              << "image <description> | status | quit" << std::endl;
}

} // namespace

bool DirectorApp::Init(int argc, char** argv) {
    bool saveConfig = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            m_configPath = argv[++i];
        } else if (arg == "--save-config") {
            saveConfig = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return false;
        } else {
            std::cerr << "[DirectorApp] Unknown argument: " << arg << std::endl;
            PrintUsage();
            return false;
        }
    }

    domain::DirectorConfig config = infrastructure::ConfigLoader::Load(m_configPath);
    if (saveConfig && !infrastructure::ConfigLoader::Save(config, m_configPath)) {
        std::cerr << "[DirectorApp] Could not write configuration." << std::endl;
    }
    m_tickHz = config.tickHz;

    // Dependency Injection / Composition Root
    auto backend = std::make_shared<infrastructure::HttpGenerationClient>(config.backend, config.defaultModel);
    backend->initialize();

    try {
        m_director = std::make_unique<application::Director>(
            application::BuildDirectorContext(config, backend));
    } catch (const std::exception& e) {
        std::cerr << "[DirectorApp] Failed to start director: " << e.what() << std::endl;
        return false;
    }

    m_director->setSeverityConsumer([](domain::TensionSeverity severity, float tension) {
        std::cout << "[DirectorApp] Scheduler: " << domain::SeverityToString(severity)
                  << " event at tension " << tension << std::endl;
    });

    m_director->setContentConsumer([](domain::TensionSeverity severity, float tension,
                                      const domain::GenerationResult& result) {
        (void)tension;
        if (!result.ok()) {
            std::cerr << "[DirectorApp] " << domain::SeverityToString(severity) << " event unavailable." << std::endl;
            return;
        }
        std::cout << "\n~ " << result.text << "\n" << std::endl;
    });

    std::cout << "[DirectorApp] Session started (" << m_tickHz << " Hz)." << std::endl;
    return true;
}

void DirectorApp::ReadInput() {
    std::string line;
    while (std::getline(std::cin, line)) {
        {
            std::lock_guard<std::mutex> lock(m_inputMutex);
            m_pendingLines.push_back(line);
        }
        if (line == "quit") break;
    }
    m_inputClosed = true;
}

bool DirectorApp::HandleCommand(const std::string& line) {
    std::istringstream in(line);
    std::string command;
    if (!(in >> command)) return true;

    if (command == "quit") {
        return false;
    }

    auto& tasks = *m_director->context().taskManager;

    if (command == "status") {
        auto snap = m_director->snapshot();
        std::cout << snap.profileSummary << "\nTension: " << snap.tensionValue << std::endl;
        for (const auto& task : tasks.GetActiveTasks()) {
            std::cout << "  [" << task->id << "] " << task->description << " ("
                      << static_cast<int>(task->progress * 100.0f) << "%)" << std::endl;
        }
    } else if (command == "analyze") {
        m_director->requestAnalysis();
    } else if (command == "room") {
        std::string archetype, theme;
        int level = 0;
        if (!(in >> archetype >> level >> theme)) {
            std::cerr << "[DirectorApp] Usage: room <archetype> <level> <theme>" << std::endl;
            return true;
        }
        auto pending = m_director->describeRoom(archetype, level, theme).share();
        tasks.SubmitTask(application::TaskType::ContentDelivery, "Describe " + archetype,
            [pending](std::shared_ptr<application::TaskStatus> status) {
                (void)status;
                auto result = pending.get();
                if (result.ok()) {
                    std::cout << "\n" << result.text << "\n" << std::endl;
                } else {
                    std::cerr << "[DirectorApp] Room description rejected after "
                              << result.attempts << " attempts." << std::endl;
                }
            });
    } else if (command == "image") {
        std::string description;
        std::getline(in >> std::ws, description);
        if (description.empty()) {
            std::cerr << "[DirectorApp] Usage: image <description>" << std::endl;
            return true;
        }
        auto pending = m_director->requestImage(description).share();
        tasks.SubmitTask(application::TaskType::ImageDelivery, "Image: " + description,
            [this, pending](std::shared_ptr<application::TaskStatus> status) {
                (void)status;
                SaveImage(pending.get());
            });
    } else {
        std::string target;
        std::getline(in >> std::ws, target);
        m_director->onPlayerAction(command, target);
    }
    return true;
}

void DirectorApp::SaveImage(const domain::ImageResult& image) {
    std::string extension = image.mimeType == "image/jpeg" ? ".jpg" : ".png";
    auto path = infrastructure::PathUtils::GetImagesDir() /
                ("still_" + std::to_string(++m_imageCounter) + extension);

    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(image.bytes.data()), static_cast<std::streamsize>(image.bytes.size()));
    if (!out) {
        throw std::runtime_error("Could not write " + path.string());
    }
    std::cout << "[DirectorApp] Saved " << path << std::endl;
}

int DirectorApp::Run(int argc, char** argv) {
    if (!Init(argc, argv)) {
        Shutdown();
        return 1;
    }

    std::thread reader(&DirectorApp::ReadInput, this);

    const auto step = std::chrono::microseconds(1000000 / m_tickHz);
    const float deltaTime = 1.0f / static_cast<float>(m_tickHz);
    auto nextTick = std::chrono::steady_clock::now();

    bool running = true;
    while (running) {
        // Read before draining; the reader closes only after its last push.
        const bool inputClosed = m_inputClosed;
        std::deque<std::string> lines;
        {
            std::lock_guard<std::mutex> lock(m_inputMutex);
            lines.swap(m_pendingLines);
        }
        for (const auto& line : lines) {
            if (!HandleCommand(line)) {
                running = false;
                break;
            }
        }
        if (running && inputClosed && lines.empty()) {
            running = false;
        }

        m_director->tick(deltaTime);

        nextTick += step;
        std::this_thread::sleep_until(nextTick);
    }

    reader.join();
    Shutdown();
    return 0;
}

void DirectorApp::Shutdown() {
    if (m_director) {
        m_director->shutdown();
        m_director.reset();
    }
}

} // namespace dreadloom::app
