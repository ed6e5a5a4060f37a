#pragma once

// =============================================================================
// window_handle.hpp — running closures on the window's thread
// =============================================================================
// Overlay tasks and clipboard callbacks run elsewhere. They never touch window
// state directly; they queue a closure through a WindowHandle and the GUI
// thread runs it on its next drain. Once the window is gone the queue is
// closed and further closures are dropped.
// =============================================================================

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace termwin
{

    class TermWindow;

    class MutationQueue
    {
    public:
        using Mutation = std::function<void(TermWindow &)>;

        /// Returns false when the queue is closed.
        bool push(Mutation mutation)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            pending_.push_back(std::move(mutation));
            return true;
        }

        std::deque<Mutation> take()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::deque<Mutation> out;
            out.swap(pending_);
            return out;
        }

        void close()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            pending_.clear();
        }

    private:
        std::mutex mutex_;
        std::deque<Mutation> pending_;
        bool closed_ = false;
    };

    class WindowHandle
    {
    public:
        WindowHandle() = default;
        explicit WindowHandle(std::shared_ptr<MutationQueue> queue) : queue_(std::move(queue)) {}

        /// Queue `mutation` for the GUI thread. Returns false when the window
        /// no longer exists.
        bool apply(MutationQueue::Mutation mutation) const
        {
            return queue_ && queue_->push(std::move(mutation));
        }

    private:
        std::shared_ptr<MutationQueue> queue_;
    };

} // namespace termwin
