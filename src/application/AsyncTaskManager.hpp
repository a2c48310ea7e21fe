/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background node tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <iostream>
#include <future>
#include <mutex>
#include <atomic>
#include <memory>
#include <algorithm>
#include <thread>

namespace medoracle::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    NodeValidation
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on detached threads and tracks their status.
 *
 * Tasks are never joined: a caller that stops waiting (e.g. after a node
 * timeout) simply abandons the task, which finishes on its own. The task
 * registry is shared with the threads so it outlives the manager if needed.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() : m_registry(std::make_shared<Registry>()) {}

    /** @brief Submits a task; the callable receives its TaskStatus as first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_registry->nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_registry->mutex);
            m_registry->activeTasks.push_back(status);
        }

        std::thread([registry = m_registry, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "[AsyncTaskManager] Task '" << status->description
                          << "' failed: unknown error during task execution." << std::endl;
            }
            status->isCompleted = true;
            registry->cleanupCompleted();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all tasks still running. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_registry->mutex);
        return m_registry->activeTasks;
    }

private:
    struct Registry {
        std::atomic<int> nextId{0};
        std::vector<std::shared_ptr<TaskStatus>> activeTasks;
        std::mutex mutex;

        void cleanupCompleted() {
            std::lock_guard<std::mutex> lock(mutex);
            activeTasks.erase(
                std::remove_if(activeTasks.begin(), activeTasks.end(),
                    [](const auto& s) { return s->isCompleted.load(); }),
                activeTasks.end()
            );
        }
    };

    std::shared_ptr<Registry> m_registry;
};

} // namespace medoracle::application
