#include "runtime/periodic_task.hpp"
#include "common/logging.hpp"

#include <exception>

namespace obix {

PeriodicTask::PeriodicTask(std::chrono::milliseconds period, Callback callback)
    : period_(period), callback_(std::move(callback)) {
    if (period_ <= std::chrono::milliseconds::zero()) {
        period_ = std::chrono::milliseconds(1);
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    stop_requested_ = false;
    woken_ = false;
    thread_ = std::thread(&PeriodicTask::run, this);
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void PeriodicTask::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

bool PeriodicTask::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stop_requested_;
}

void PeriodicTask::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        cv_.wait_for(lock, period_, [this] { return stop_requested_ || woken_; });
        if (stop_requested_) break;
        woken_ = false;

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            logging::OBIX.warn("periodic task failed: ", e.what(), "\n");
        }
        lock.lock();
    }
}

} // namespace obix
