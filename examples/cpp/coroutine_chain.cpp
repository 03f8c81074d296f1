/**
 * @file coroutine_chain.cpp
 * @brief C++20 coroutine chaining several bridged operations
 *
 * Each co_await suspends the coroutine until the native runtime reports
 * completion; the coroutine resumes on the runtime's worker thread.
 *
 * Requires: C++20 with coroutine support
 */

#include <tether.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

tether::Future<long long> fetch_size(tether::LoopbackRuntime &runtime, std::string path) {
    return tether::bridge<long long>(
        runtime.start([path](tether::LoopbackRuntime::Context &ctx) {
            std::this_thread::sleep_for(5ms);
            ctx.set_result(static_cast<long long>(path.size()) * 1024);
            return TETHER_ERROR_NONE;
        }),
        tether::LoopbackRuntime::extractor<long long>());
}

/**
 * Sum the sizes of several objects, one lookup at a time.
 */
tether::Task<long long> total_size(tether::LoopbackRuntime &runtime) {
    long long total = 0;
    for (const char *path : {"images/a.png", "images/b.png", "docs/readme.txt"}) {
        long long size = co_await fetch_size(runtime, path);
        std::cout << path << ": " << size << " bytes\n";
        total += size;
    }
    co_return total;
}

} // namespace

int main() {
    try {
        tether::LoopbackRuntime runtime;

        auto task = total_size(runtime);
        task.resume();
        while (!task.done()) {
            std::this_thread::sleep_for(1ms);
        }

        std::cout << "Total: " << task.get() << " bytes\n";
        runtime.drain();
        return 0;

    } catch (const tether::Error &e) {
        std::cerr << "Tether error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
