#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace voicetype {

// Runs tasks one at a time, in the order they were posted, on a single
// worker thread. Delayed tasks join the queue when their deadline passes.
class SerialExecutor {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    explicit SerialExecutor(std::string name);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    bool start();

    // Pending tasks and timers are dropped. Must not be called from the worker.
    void stop();
    bool is_running() const { return running_.load(); }

    // False once the executor is stopped
    bool post(Task task);

    // Returns 0 if the executor is stopped
    TimerId post_delayed(std::chrono::milliseconds delay, Task task);

    // No-op for timers that already fired
    void cancel(TimerId id);

    bool is_current_thread() const;

    const std::string& name() const { return name_; }

private:
    struct Timer {
        Clock::time_point due;
        Task task;
    };

    void run_loop();
    void run_task(const Task& task);

    std::string name_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
};

} // namespace voicetype
