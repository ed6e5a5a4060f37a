#pragma once

// =============================================================================
// task_executor.hpp — where overlay tasks run
// =============================================================================
// Overlay tasks block waiting for keys, so they run off the GUI thread. A
// failing task is logged by the executor; the task itself is responsible for
// scheduling its overlay's cancellation on the way out.
// =============================================================================

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace termwin
{

    class TaskExecutor
    {
    public:
        virtual ~TaskExecutor() = default;
        virtual void spawn(const std::string &name, std::function<void()> task) = 0;
    };

    /// One std::thread per task; all are joined on destruction.
    class ThreadExecutor : public TaskExecutor
    {
    public:
        ThreadExecutor() = default;
        ThreadExecutor(const ThreadExecutor &) = delete;
        ThreadExecutor &operator=(const ThreadExecutor &) = delete;
        ~ThreadExecutor() override;

        void spawn(const std::string &name, std::function<void()> task) override;

        /// Join threads whose task has returned.
        void reap();

    private:
        struct Worker
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        std::mutex mutex_;
        std::vector<Worker> workers_;
    };

    /// Run `task` and log anything it throws as an overlay task failure.
    void run_logged(const std::string &name, const std::function<void()> &task);

} // namespace termwin
