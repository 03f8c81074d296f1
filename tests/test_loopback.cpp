/**
 * @file test_loopback.cpp
 * @brief Threaded tests: bridging operations run by LoopbackRuntime workers
 */

#include "test_common.hpp"

#include <tether.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tether::LoopbackRuntime;
using tether::ResultState;
using tether::TransferState;

namespace {

bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

/// Gate a worker waits on until the test opens it
class Gate {
  public:
    void open() { open_.store(true, std::memory_order_release); }

    void wait() const {
        while (!open_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(1ms);
        }
    }

  private:
    std::atomic<bool> open_{false};
};

} // namespace

// =============================================================================
// Futures
// =============================================================================

TEST(loopback_success_across_threads) {
    LoopbackRuntime runtime;
    std::thread::id worker_id;
    auto result = tether::bridge<int>(runtime.start([&worker_id](LoopbackRuntime::Context &ctx) {
        worker_id = std::this_thread::get_id();
        ctx.set_result(42);
        return TETHER_ERROR_NONE;
    }),
                                      LoopbackRuntime::extractor<int>());

    ASSERT_EQ(result.get(), 42);
    ASSERT(worker_id != std::this_thread::get_id());
    runtime.drain();
    ASSERT_EQ(runtime.live_handles(), 0u);
}

TEST(loopback_finished_workers_are_joined) {
    LoopbackRuntime runtime;
    constexpr int ops = 64;
    for (int i = 0; i < ops; ++i) {
        auto result = tether::bridge<int>(runtime.start([i](LoopbackRuntime::Context &ctx) {
            ctx.set_result(i);
            return TETHER_ERROR_NONE;
        }),
                                          LoopbackRuntime::extractor<int>());
        ASSERT_EQ(result.get(), i);
        std::this_thread::sleep_for(1ms);
    }

    ASSERT(runtime.tracked_workers() < static_cast<size_t>(ops / 2));
    runtime.drain();
    ASSERT_EQ(runtime.tracked_workers(), 0u);
    ASSERT_EQ(runtime.live_handles(), 0u);
}

TEST(loopback_domain_error) {
    LoopbackRuntime runtime;
    auto result = tether::bridge<int>(runtime.start([](LoopbackRuntime::Context &ctx) {
        ctx.set_error_message("object not found");
        return 404;
    }),
                                      LoopbackRuntime::extractor<int>());

    result.wait();
    ASSERT(result.state() == ResultState::Failed);
    ASSERT_EQ(result.error().code(), 404);
    ASSERT_EQ(result.error().message(), std::string("object not found"));
}

TEST(loopback_work_exception_is_domain_error) {
    LoopbackRuntime runtime;
    auto result = tether::bridge<int>(runtime.start([](LoopbackRuntime::Context &) -> int {
        throw std::runtime_error("disk on fire");
    }),
                                      LoopbackRuntime::extractor<int>());

    result.wait();
    ASSERT(result.state() == ResultState::Failed);
    ASSERT_EQ(result.error().code(), -1);
    ASSERT_EQ(result.error().message(), std::string("disk on fire"));
}

TEST(loopback_wrong_result_type_is_unknown_failure) {
    LoopbackRuntime runtime;
    auto result = tether::bridge<int>(runtime.start([](LoopbackRuntime::Context &ctx) {
        ctx.set_result(std::string("not an int"));
        return TETHER_ERROR_NONE;
    }),
                                      LoopbackRuntime::extractor<int>());

    result.wait();
    ASSERT(result.state() == ResultState::Failed);
    ASSERT(result.error().is_unknown());
}

TEST(loopback_cancel_cooperative) {
    LoopbackRuntime runtime;
    tether::CancelSource source;
    std::atomic<bool> running{false};

    auto result = tether::bridge<int>(runtime.start([&running](LoopbackRuntime::Context &ctx) {
        running = true;
        while (!ctx.canceled()) {
            std::this_thread::sleep_for(1ms);
        }
        return TETHER_ERROR_CANCELLED;
    }),
                                      LoopbackRuntime::extractor<int>(), source.token());

    ASSERT(wait_until([&running] { return running.load(); }));
    ASSERT(!result.ready());
    source.request_cancel();

    ASSERT(result.wait_for(5000ms));
    ASSERT(result.state() == ResultState::Canceled);
    runtime.drain();
    ASSERT_EQ(runtime.live_handles(), 0u);
}

TEST(loopback_abandoned_future_releases) {
    LoopbackRuntime runtime;
    Gate gate;
    {
        auto dropped = tether::bridge<int>(runtime.start([&gate](LoopbackRuntime::Context &ctx) {
            gate.wait();
            ctx.set_result(1);
            return TETHER_ERROR_NONE;
        }),
                                           LoopbackRuntime::extractor<int>());
    }
    ASSERT_EQ(runtime.live_handles(), 1u);
    gate.open();
    runtime.drain();
    ASSERT_EQ(runtime.live_handles(), 0u);
}

TEST(loopback_then_runs_on_worker) {
    LoopbackRuntime runtime;
    std::atomic<bool> on_worker{false};
    std::atomic<bool> ran{false};
    auto caller = std::this_thread::get_id();

    auto result = tether::bridge<int>(runtime.start([](LoopbackRuntime::Context &ctx) {
        std::this_thread::sleep_for(5ms);
        ctx.set_result(3);
        return TETHER_ERROR_NONE;
    }),
                                      LoopbackRuntime::extractor<int>());
    result.then([&](const tether::Future<int> &) {
        on_worker = std::this_thread::get_id() != caller;
        ran = true;
    });

    runtime.drain();
    ASSERT(ran.load());
    // The continuation runs where resolution happened (or inline if already resolved)
    ASSERT(on_worker.load() || result.ready());
}

// =============================================================================
// Transfers
// =============================================================================

TEST(loopback_transfer_progress) {
    LoopbackRuntime runtime;
    std::mutex mutex;
    std::vector<long long> bytes;
    TransferState last = TransferState::Pending;

    auto [native, controller] = runtime.start_transfer([](LoopbackRuntime::Context &ctx) {
        for (long long b = 100; b <= 1000; b += 100) {
            ctx.report_progress(b, 1000);
        }
        ctx.set_result(std::string("etag-7"));
        return TETHER_ERROR_NONE;
    });

    auto transfer = tether::bridge_transfer<std::string>(
        std::move(native), std::move(controller), LoopbackRuntime::extractor<std::string>(),
        tether::make_observer([&](const tether::TransferProgress &p) {
            std::lock_guard<std::mutex> lock(mutex);
            bytes.push_back(p.bytes_transferred);
            last = p.state;
        }));

    ASSERT_EQ(transfer.result().get(), std::string("etag-7"));
    runtime.drain();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(bytes.size(), 11u);
    for (size_t i = 1; i < bytes.size(); i++) {
        ASSERT_GE(bytes[i], bytes[i - 1]);
    }
    ASSERT(last == TransferState::Succeeded);
    ASSERT_EQ(transfer.snapshot().bytes_transferred, 1000);
    ASSERT_EQ(*transfer.snapshot().metadata_as<std::string>(), std::string("etag-7"));
    ASSERT_EQ(runtime.live_handles(), 0u);
}

TEST(loopback_transfer_pause_blocks_worker) {
    LoopbackRuntime runtime;
    Gate gate;
    std::atomic<tether::TransferMonitor *> monitor{nullptr};

    auto [native, controller] = runtime.start_transfer([&gate](LoopbackRuntime::Context &ctx) {
        gate.wait();
        ctx.report_progress(100, 300);
        ctx.report_progress(200, 300);
        ctx.report_progress(300, 300);
        ctx.set_result(300);
        return TETHER_ERROR_NONE;
    });

    auto transfer = tether::bridge_transfer<int>(
        std::move(native), std::move(controller), LoopbackRuntime::extractor<int>(),
        tether::make_observer([&monitor](const tether::TransferProgress &p) {
            // Pause from inside the first tick so the worker blocks on the next one
            if (p.bytes_transferred == 100) {
                monitor.load()->request_pause();
            }
        }));
    monitor = transfer.monitor().get();
    gate.open();

    ASSERT(wait_until([&] { return transfer.snapshot().state == TransferState::Paused; }));
    std::this_thread::sleep_for(20ms);
    ASSERT_EQ(transfer.snapshot().bytes_transferred, 100);
    ASSERT(!transfer.result().ready());

    ASSERT(transfer.resume());
    ASSERT_EQ(transfer.result().get(), 300);
    ASSERT(transfer.snapshot().state == TransferState::Succeeded);
}

TEST(loopback_transfer_cancel_while_paused) {
    LoopbackRuntime runtime;
    Gate gate;
    std::atomic<tether::TransferMonitor *> monitor{nullptr};

    auto [native, controller] = runtime.start_transfer([&gate](LoopbackRuntime::Context &ctx) {
        gate.wait();
        for (long long b = 10; b <= 100; b += 10) {
            ctx.report_progress(b, 100);
            if (ctx.canceled()) {
                return TETHER_ERROR_CANCELLED;
            }
        }
        return TETHER_ERROR_NONE;
    });

    auto transfer = tether::bridge_transfer<int>(
        std::move(native), std::move(controller), LoopbackRuntime::extractor<int>(),
        tether::make_observer([&monitor](const tether::TransferProgress &p) {
            if (p.bytes_transferred == 10) {
                monitor.load()->request_pause();
            }
        }));
    monitor = transfer.monitor().get();
    gate.open();

    ASSERT(wait_until([&] { return transfer.snapshot().state == TransferState::Paused; }));
    ASSERT(transfer.cancel());

    ASSERT(transfer.result().wait_for(5000ms));
    ASSERT(transfer.result().state() == ResultState::Canceled);
    ASSERT(transfer.snapshot().state == TransferState::Canceled);
    runtime.drain();
    ASSERT_EQ(runtime.live_handles(), 0u);
}

int main() {
    printf("Running loopback runtime tests...\n");

    RUN_TEST(loopback_success_across_threads);
    RUN_TEST(loopback_finished_workers_are_joined);
    RUN_TEST(loopback_domain_error);
    RUN_TEST(loopback_work_exception_is_domain_error);
    RUN_TEST(loopback_wrong_result_type_is_unknown_failure);
    RUN_TEST(loopback_cancel_cooperative);
    RUN_TEST(loopback_abandoned_future_releases);
    RUN_TEST(loopback_then_runs_on_worker);
    RUN_TEST(loopback_transfer_progress);
    RUN_TEST(loopback_transfer_pause_blocks_worker);
    RUN_TEST(loopback_transfer_cancel_while_paused);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
