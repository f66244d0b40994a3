#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <condition_variable>

namespace remoteops::runtime {

// Runs detached work on its own thread and keeps count of what is still
// outstanding, so shutdown can wait for it.
class TaskTracker {
public:
    TaskTracker() = default;
    ~TaskTracker();

    // Non-copyable
    TaskTracker(const TaskTracker&) = delete;
    TaskTracker& operator=(const TaskTracker&) = delete;

    // Start `task` on a new detached thread. Returns false if the thread
    // could not be created (the task is not run).
    bool launch(std::function<void()> task);

    // Block until every launched task has returned
    void wait_idle();

    size_t outstanding() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;

    void finish();
};

} // namespace remoteops::runtime
