/**
 * @file stress_test.cpp
 * @brief Stress test for the tether completion bridge
 *
 * Tests:
 * 1. Registry churn - many threads adding, delivering and removing tokens
 * 2. Bridged operations - many concurrent loopback operations
 * 3. Cancellation under load - random cancels racing native completion
 * 4. Transfers - progress, pause and resume from multiple threads
 *
 * Every test checks that each native handle is released exactly once and
 * that the process-wide registry returns to its baseline.
 *
 * Run:   ./tests/stress_test [options]
 *
 * Options:
 *   --duration <seconds>   Test duration (default: 5)
 *   --threads <count>      Number of threads (default: 4)
 *   --max-inflight <n>     Max concurrent operations (default: 128)
 */

#include <tether.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;
using tether::LoopbackRuntime;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int duration_sec = 5;
    int num_threads = 4;
    int max_inflight = 128;
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> ops_submitted{0};
    std::atomic<long long> ops_succeeded{0};
    std::atomic<long long> ops_canceled{0};
    std::atomic<long long> ops_failed{0};
    std::atomic<long long> cancels_requested{0};
    std::atomic<long long> progress_ticks{0};
    std::atomic<long long> violations{0};

    void print(double elapsed_sec) const {
        long long settled = ops_succeeded + ops_canceled + ops_failed;
        double rate = settled / elapsed_sec;

        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2) << elapsed_sec
                  << " seconds\n";
        std::cout << "Ops submitted:     " << ops_submitted << "\n";
        std::cout << "Ops succeeded:     " << ops_succeeded << "\n";
        std::cout << "Ops canceled:      " << ops_canceled << "\n";
        std::cout << "Ops failed:        " << ops_failed << "\n";
        std::cout << "Cancels requested: " << cancels_requested << "\n";
        std::cout << "Progress ticks:    " << progress_ticks << "\n";
        std::cout << "Settled/sec:       " << std::setprecision(0) << rate << "\n";
        std::cout << "Violations:        " << violations << "\n";
    }

    void record(tether::ResultState state) {
        switch (state) {
        case tether::ResultState::Succeeded:
            ops_succeeded++;
            break;
        case tether::ResultState::Canceled:
            ops_canceled++;
            break;
        case tether::ResultState::Failed:
            ops_failed++;
            break;
        case tether::ResultState::Pending:
            violations++;
            break;
        }
    }
};

namespace {

void check_released(const LoopbackRuntime &runtime, size_t registry_baseline, Stats &stats,
                    const char *test) {
    size_t live = runtime.live_handles();
    size_t pending = tether::detail::CallbackRegistry::instance().pending();
    if (live != 0 || pending != registry_baseline) {
        std::cerr << "*** " << test << ": " << live << " handles live, " << pending
                  << " registrations pending (baseline " << registry_baseline << ") ***\n";
        stats.violations++;
    }
}

} // namespace

// =============================================================================
// Test 1: Registry churn
// =============================================================================

void test_registry_churn(Stats &stats, int num_threads, int duration_sec) {
    std::cout << "\n--- Test: Registry Churn (" << num_threads << " threads) ---\n";

    tether::detail::CallbackRegistry registry;
    std::atomic<long long> invoked{0};
    std::atomic<long long> expected{0};
    auto end_time = Clock::now() + std::chrono::seconds(duration_sec);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(static_cast<unsigned>(t) * 7919u + 1u);
            std::uniform_int_distribution<int> coin(0, 3);
            std::vector<int> mine;

            while (Clock::now() < end_time) {
                for (int i = 0; i < 64; i++) {
                    mine.push_back(registry.add([&invoked] { invoked++; }));
                }
                for (int token : mine) {
                    if (coin(gen) == 0) {
                        registry.remove(token);
                    } else if (registry.deliver(token)) {
                        expected++;
                        // Duplicate delivery must be ignored
                        if (registry.deliver(token)) {
                            stats.violations++;
                        }
                    } else {
                        stats.violations++;
                    }
                }
                mine.clear();
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    auto s = registry.stats();
    if (invoked != expected || s.pending() != 0) {
        stats.violations++;
    }
    std::cout << "Registered " << s.registered() << ", delivered " << s.delivered() << ", removed "
              << s.removed() << ", ignored " << s.ignored() << "\n";
}

// =============================================================================
// Test 2: Bridged operations
// =============================================================================

void test_bridged_operations(Stats &stats, int num_threads, int max_inflight, int duration_sec) {
    std::cout << "\n--- Test: Bridged Operations (" << num_threads << " threads) ---\n";

    size_t baseline = tether::detail::CallbackRegistry::instance().pending();
    LoopbackRuntime runtime;
    std::atomic<int> inflight{0};
    auto end_time = Clock::now() + std::chrono::seconds(duration_sec);
    int per_thread = std::max(1, max_inflight / num_threads);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(static_cast<unsigned>(t) + 17u);
            std::uniform_int_distribution<int> outcome(0, 9);
            std::vector<tether::Future<int>> batch;

            while (Clock::now() < end_time) {
                for (int i = 0; i < per_thread; i++) {
                    int pick = outcome(gen);
                    inflight++;
                    stats.ops_submitted++;
                    auto future = tether::bridge<int>(
                        runtime.start([pick](LoopbackRuntime::Context &ctx) {
                            if (pick == 0) {
                                ctx.set_error_message("simulated failure");
                                return 500;
                            }
                            ctx.set_result(pick);
                            return TETHER_ERROR_NONE;
                        }),
                        LoopbackRuntime::extractor<int>());
                    future.then([&inflight](const tether::Future<int> &) { inflight--; });
                    batch.push_back(std::move(future));
                }
                for (auto &f : batch) {
                    f.wait();
                    stats.record(f.state());
                    if (f.state() == tether::ResultState::Failed && f.error().code() != 500) {
                        stats.violations++;
                    }
                }
                batch.clear();
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    runtime.drain();

    if (inflight != 0) {
        stats.violations++;
    }
    check_released(runtime, baseline, stats, "bridged operations");
}

// =============================================================================
// Test 3: Cancellation under load
// =============================================================================

void test_cancellation_under_load(Stats &stats, int num_threads, int duration_sec) {
    std::cout << "\n--- Test: Cancellation Under Load (" << num_threads << " threads) ---\n";

    size_t baseline = tether::detail::CallbackRegistry::instance().pending();
    LoopbackRuntime runtime;
    auto end_time = Clock::now() + std::chrono::seconds(duration_sec);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(static_cast<unsigned>(t) * 31u + 5u);
            std::uniform_int_distribution<int> spin(0, 50);
            std::uniform_int_distribution<int> coin(0, 1);

            while (Clock::now() < end_time) {
                tether::CancelSource source;
                int iterations = spin(gen);
                auto future = tether::bridge<int>(
                    runtime.start([iterations](LoopbackRuntime::Context &ctx) {
                        for (int i = 0; i < iterations; i++) {
                            if (ctx.canceled()) {
                                return TETHER_ERROR_CANCELLED;
                            }
                            std::this_thread::sleep_for(10us);
                        }
                        ctx.set_result(iterations);
                        return TETHER_ERROR_NONE;
                    }),
                    LoopbackRuntime::extractor<int>(), source.token());
                stats.ops_submitted++;

                bool canceled = false;
                if (coin(gen)) {
                    std::this_thread::sleep_for(std::chrono::microseconds(spin(gen)));
                    canceled = source.request_cancel();
                    stats.cancels_requested++;
                }

                future.wait();
                stats.record(future.state());
                // A cancel requested before settlement must resolve Canceled
                if (!canceled && future.state() == tether::ResultState::Canceled) {
                    stats.violations++;
                }
                if (future.state() == tether::ResultState::Failed) {
                    stats.violations++;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    runtime.drain();
    check_released(runtime, baseline, stats, "cancellation under load");
}

// =============================================================================
// Test 4: Transfers
// =============================================================================

void test_transfers(Stats &stats, int num_threads, int duration_sec) {
    std::cout << "\n--- Test: Transfers (" << num_threads << " threads) ---\n";

    size_t baseline = tether::detail::CallbackRegistry::instance().pending();
    LoopbackRuntime runtime;
    auto end_time = Clock::now() + std::chrono::seconds(duration_sec);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(static_cast<unsigned>(t) * 101u + 3u);
            std::uniform_int_distribution<int> action(0, 3);

            while (Clock::now() < end_time) {
                auto [native, controller] =
                    runtime.start_transfer([](LoopbackRuntime::Context &ctx) {
                        for (long long b = 1024; b <= 16 * 1024; b += 1024) {
                            ctx.report_progress(b, 16 * 1024);
                            if (ctx.canceled()) {
                                return TETHER_ERROR_CANCELLED;
                            }
                        }
                        ctx.set_result(16 * 1024LL);
                        return TETHER_ERROR_NONE;
                    });
                stats.ops_submitted++;

                auto last_bytes = std::make_shared<std::atomic<long long>>(0);
                auto transfer = tether::bridge_transfer<long long>(
                    std::move(native), std::move(controller),
                    LoopbackRuntime::extractor<long long>(),
                    tether::make_observer([&stats, last_bytes](const tether::TransferProgress &p) {
                        stats.progress_ticks++;
                        // Byte counts never go backwards
                        if (p.bytes_transferred < last_bytes->load()) {
                            stats.violations++;
                        }
                        last_bytes->store(p.bytes_transferred);
                    }));

                switch (action(gen)) {
                case 0:
                    if (transfer.cancel()) {
                        stats.cancels_requested++;
                    }
                    break;
                case 1:
                    if (transfer.pause()) {
                        std::this_thread::sleep_for(50us);
                        transfer.resume();
                    }
                    break;
                default:
                    break;
                }

                transfer.result().wait();
                stats.record(transfer.result().state());
                if (!tether::is_terminal(transfer.snapshot().state)) {
                    stats.violations++;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    runtime.drain();
    check_released(runtime, baseline, stats, "transfers");
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --duration <seconds>   Test duration (default: 5)\n";
    std::cerr << "  --threads <count>      Number of threads (default: 4)\n";
    std::cerr << "  --max-inflight <n>     Max concurrent operations (default: 128)\n";
    std::cerr << "  --quick                Quick test (1 second per test)\n";
    std::cerr << "  --help                 Show this help\n";
}

int main(int argc, char **argv) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            config.duration_sec = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::stoi(argv[++i]);
        } else if (arg == "--max-inflight" && i + 1 < argc) {
            config.max_inflight = std::stoi(argv[++i]);
        } else if (arg == "--quick") {
            config.duration_sec = 1;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "=== Tether Stress Test ===\n";
    std::cout << "Duration:     " << config.duration_sec << " seconds per test\n";
    std::cout << "Threads:      " << config.num_threads << "\n";
    std::cout << "Max inflight: " << config.max_inflight << "\n";

    try {
        Stats stats;
        auto total_start = Clock::now();

        test_registry_churn(stats, config.num_threads, config.duration_sec);
        test_bridged_operations(stats, config.num_threads, config.max_inflight,
                                config.duration_sec);
        test_cancellation_under_load(stats, config.num_threads, config.duration_sec);
        test_transfers(stats, config.num_threads, config.duration_sec);

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();
        stats.print(total_elapsed);

        if (stats.violations > 0) {
            std::cout << "\n*** STRESS TEST FAILED: " << stats.violations
                      << " invariant violations ***\n";
            return 1;
        }

        std::cout << "\n=== STRESS TEST PASSED ===\n";
        return 0;

    } catch (const tether::Error &e) {
        std::cerr << "Tether error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
