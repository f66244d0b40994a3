#include "runtime/task_tracker.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

namespace remoteops::runtime {

TaskTracker::~TaskTracker() {
    wait_idle();
}

bool TaskTracker::launch(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_++;
    }

    try {
        std::thread([this, task = std::move(task)]() mutable {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("Background task failed: {}", e.what());
            }
            // Release captured state before the count drops
            task = nullptr;
            finish();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start worker thread: {}", e.what());
        finish();
        return false;
    }

    return true;
}

void TaskTracker::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (outstanding_ > 0) {
        spdlog::info("Waiting for {} outstanding task(s)", outstanding_);
    }
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

size_t TaskTracker::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

void TaskTracker::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_--;
    if (outstanding_ == 0) {
        idle_cv_.notify_all();
    }
}

} // namespace remoteops::runtime
