/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <thread>
#include <algorithm>
#include <iostream>

namespace dreadloom::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    ContentDelivery,
    Analysis,
    ImageDelivery
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 *
 * Tasks run on detached threads. waitForIdle() is the only join point, so owners
 * must call it before destroying anything a task captured.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        waitForIdle();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                // Status first, then the caller's arguments.
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[Tasks] '" << status->description << "' failed: " << e.what() << std::endl;
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
                std::cerr << "[Tasks] '" << status->description << "' failed with an unknown error." << std::endl;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has finished. */
    void waitForIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idleCv.wait(lock, [this] { return m_running == 0; });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        --m_running;
        // Notify under the lock; the manager may be destroyed right after waitForIdle returns.
        m_idleCv.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idleCv;
    int m_running = 0;
};

} // namespace dreadloom::application
