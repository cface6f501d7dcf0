#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace obix {

/// Runs a callback on its own thread once per period, or earlier when
/// woken. stop() and the destructor join the thread; a callback that
/// is already running finishes first.
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::chrono::milliseconds period, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    void wake();
    bool running() const;

private:
    std::chrono::milliseconds period_;
    Callback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool running_ = false;
    bool stop_requested_ = false;
    bool woken_ = false;

    void run();
};

} // namespace obix
