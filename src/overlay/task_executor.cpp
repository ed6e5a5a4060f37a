// =============================================================================
// task_executor.cpp
// =============================================================================

#include "task_executor.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

namespace termwin
{

    void run_logged(const std::string &name, const std::function<void()> &task)
    {
        try
        {
            task();
        }
        catch (const WindowError &e)
        {
            TERMWIN_LOG_ERROR("task '" << name << "' failed: " << e.what());
        }
        catch (const std::exception &e)
        {
            TERMWIN_LOG_ERROR(OverlayError("task '" + name + "' failed: " + e.what()).what());
        }
    }

    ThreadExecutor::~ThreadExecutor()
    {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
        for (auto &w : workers)
            if (w.thread.joinable())
                w.thread.join();
    }

    void ThreadExecutor::spawn(const std::string &name, std::function<void()> task)
    {
        reap();

        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        auto done = worker.done;
        worker.thread = std::thread([name, task = std::move(task), done]()
                                    {
                                        run_logged(name, task);
                                        done->store(true);
                                    });

        std::lock_guard<std::mutex> lock(mutex_);
        workers_.push_back(std::move(worker));
    }

    void ThreadExecutor::reap()
    {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = workers_.begin(); it != workers_.end();)
            {
                if (it->done->load())
                {
                    finished.push_back(std::move(*it));
                    it = workers_.erase(it);
                }
                else
                    ++it;
            }
        }
        for (auto &w : finished)
            w.thread.join();
    }

} // namespace termwin
