#include "serial_executor.hpp"
#include <algorithm>
#include <iostream>
#include <exception>
#include <vector>

namespace voicetype {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name)) {
}

SerialExecutor::~SerialExecutor() {
    stop();
}

bool SerialExecutor::start() {
    if (running_.load()) return true;

    running_.store(true);
    worker_ = std::thread([this]() {
        run_loop();
    });
    return true;
}

void SerialExecutor::stop() {
    if (!running_.load()) return;

    if (is_current_thread()) {
        std::cerr << "[" << name_ << "] stop() called from its own worker, ignoring" << std::endl;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        queue_.clear();
        timers_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

SerialExecutor::TimerId SerialExecutor::post_delayed(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return 0;
        id = next_timer_id_++;
        timers_[id] = Timer{Clock::now() + delay, std::move(task)};
    }
    cv_.notify_one();
    return id;
}

void SerialExecutor::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

bool SerialExecutor::is_current_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load()) {
        // Move due timers onto the queue in deadline order
        auto now = Clock::now();
        std::vector<std::pair<Clock::time_point, TimerId>> due;
        Clock::time_point next_due = Clock::time_point::max();
        for (const auto& entry : timers_) {
            if (entry.second.due <= now) {
                due.emplace_back(entry.second.due, entry.first);
            } else if (entry.second.due < next_due) {
                next_due = entry.second.due;
            }
        }
        std::sort(due.begin(), due.end());
        for (const auto& d : due) {
            auto it = timers_.find(d.second);
            queue_.push_back(std::move(it->second.task));
            timers_.erase(it);
        }

        if (queue_.empty()) {
            if (next_due == Clock::time_point::max()) {
                cv_.wait(lock);
            } else {
                cv_.wait_until(lock, next_due);
            }
            continue;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        run_task(task);
        lock.lock();
    }
}

void SerialExecutor::run_task(const Task& task) {
    if (!task) return;

    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] task failed: " << e.what() << std::endl;
    }
}

} // namespace voicetype
