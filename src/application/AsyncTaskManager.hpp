/**
 * @file AsyncTaskManager.hpp
 * @brief Owns the worker threads that execute pipeline runs.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace webforge::application {

/**
 * @enum TaskType
 * @brief Kind of run a worker executes.
 */
enum class TaskType {
    Build,
    Update
};

/**
 * @struct TaskStatus
 * @brief Progress flags of one worker, shared with the task body.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Build;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written by the worker before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Starts one thread per task and joins it once the task is over.
 *
 * Finished threads are reaped on the next submission or wait, so the
 * manager never detaches a thread that could outlive it.
 */
class AsyncTaskManager {
public:
    using TaskBody = std::function<void(std::shared_ptr<TaskStatus>)>;

    AsyncTaskManager() = default;
    ~AsyncTaskManager() { WaitAll(); }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Runs `body` on a new thread.
     * @throws std::system_error when the thread cannot be created.
     */
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, TaskBody body) {
        ReapFinished();

        auto status = std::make_shared<TaskStatus>();
        status->type = type;
        status->description = description;

        std::lock_guard<std::mutex> lock(m_mutex);
        status->id = ++m_nextId;
        const int id = status->id;
        ++m_running;
        try {
            m_threads.emplace(id, std::thread([this, status, body = std::move(body)]() {
                Execute(status, body);
            }));
        } catch (...) {
            --m_running;
            throw;
        }
        return status;
    }

    size_t RunningCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    /** @brief Blocks until every submitted task has finished, then joins the threads. */
    void WaitAll() {
        std::map<int, std::thread> threads;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_idle.wait(lock, [this] { return m_running == 0; });
            threads.swap(m_threads);
            m_finished.clear();
        }
        for (auto& [id, thread] : threads) {
            if (thread.joinable()) thread.join();
        }
    }

private:
    void Execute(const std::shared_ptr<TaskStatus>& status, const TaskBody& body) {
        try {
            body(status);
        } catch (const std::exception& e) {
            status->failed = true;
            status->errorMessage = e.what();
            std::cerr << "[AsyncTaskManager] Task '" << status->description
                      << "' failed: " << e.what() << std::endl;
        }
        status->isCompleted = true;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished.push_back(status->id);
        if (--m_running == 0) m_idle.notify_all();
    }

    void ReapFinished() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (int id : m_finished) {
                auto it = m_threads.find(id);
                if (it == m_threads.end()) continue;
                done.push_back(std::move(it->second));
                m_threads.erase(it);
            }
            m_finished.clear();
        }
        for (auto& thread : done) {
            if (thread.joinable()) thread.join();
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_idle;
    std::map<int, std::thread> m_threads;
    std::vector<int> m_finished;
    size_t m_running = 0;
    int m_nextId = 0;
};

} // namespace webforge::application
