// Tests for SerialExecutor ordering, timers and cancellation
// Compile: g++ -std=c++17 -pthread -I../include -o test_serial_executor test_serial_executor.cpp ../src/serial_executor.cpp

#include "serial_executor.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace voicetype;

static bool wait_for(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

void test_fifo_order() {
    std::cout << "Testing tasks run in post order..." << std::endl;

    SerialExecutor executor("test");
    assert(executor.start());

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 100; ++i) {
        assert(executor.post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }

    assert(wait_for([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 100;
    }));
    for (int i = 0; i < 100; ++i) {
        assert(order[i] == i);
    }

    std::cout << "  PASS" << std::endl;
}

void test_single_thread() {
    std::cout << "Testing tasks never overlap..." << std::endl;

    SerialExecutor executor("test");
    executor.start();

    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> done{0};

    std::vector<std::thread> posters;
    for (int t = 0; t < 4; ++t) {
        posters.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                executor.post([&]() {
                    int now = ++inside;
                    if (now > max_inside.load()) max_inside.store(now);
                    assert(executor.is_current_thread());
                    --inside;
                    ++done;
                });
            }
        });
    }
    for (auto& p : posters) p.join();

    assert(wait_for([&]() { return done.load() == 200; }));
    assert(max_inside.load() == 1);
    assert(!executor.is_current_thread());

    std::cout << "  PASS" << std::endl;
}

void test_delayed_tasks() {
    std::cout << "Testing delayed tasks fire in deadline order..." << std::endl;

    SerialExecutor executor("test");
    executor.start();

    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int value) {
        return [&, value]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(value);
        };
    };

    auto start = std::chrono::steady_clock::now();
    assert(executor.post_delayed(std::chrono::milliseconds(60), record(3)) != 0);
    assert(executor.post_delayed(std::chrono::milliseconds(20), record(2)) != 0);
    executor.post(record(1));

    assert(wait_for([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 3;
    }));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(order[0] == 1 && order[1] == 2 && order[2] == 3);
    assert(elapsed >= 60);

    std::cout << "  PASS" << std::endl;
}

void test_cancel() {
    std::cout << "Testing timer cancellation..." << std::endl;

    SerialExecutor executor("test");
    executor.start();

    std::atomic<bool> cancelled_ran{false};
    std::atomic<bool> kept_ran{false};

    SerialExecutor::TimerId id = executor.post_delayed(std::chrono::milliseconds(30), [&]() { cancelled_ran = true; });
    executor.post_delayed(std::chrono::milliseconds(60), [&]() { kept_ran = true; });
    executor.cancel(id);

    assert(wait_for([&]() { return kept_ran.load(); }));
    assert(!cancelled_ran.load());

    // Cancelling a fired timer is harmless
    executor.cancel(id);

    std::cout << "  PASS" << std::endl;
}

void test_exception_contained() {
    std::cout << "Testing a throwing task does not kill the worker..." << std::endl;

    SerialExecutor executor("test");
    executor.start();

    std::atomic<bool> after{false};
    executor.post([]() { throw std::runtime_error("boom"); });
    executor.post([&]() { after = true; });

    assert(wait_for([&]() { return after.load(); }));

    std::cout << "  PASS" << std::endl;
}

void test_stop_drops_pending() {
    std::cout << "Testing stop..." << std::endl;

    SerialExecutor executor("test");
    executor.start();

    std::atomic<bool> timer_ran{false};
    executor.post_delayed(std::chrono::milliseconds(50), [&]() { timer_ran = true; });
    executor.stop();

    assert(!executor.is_running());
    assert(!executor.post([]() {}));
    assert(executor.post_delayed(std::chrono::milliseconds(1), []() {}) == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(!timer_ran.load());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Serial Executor Tests ===\n" << std::endl;

    test_fifo_order();
    test_single_thread();
    test_delayed_tasks();
    test_cancel();
    test_exception_contained();
    test_stop_drops_pending();

    std::cout << "\n=== All serial executor tests passed! ===\n" << std::endl;
    return 0;
}
