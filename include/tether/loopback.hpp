/**
 * @file loopback.hpp
 * @brief In-process native runtime running operations on worker threads
 *
 * LoopbackRuntime implements the tether.h future and controller contracts
 * for work functions supplied by the caller.  Each operation runs on its
 * own thread; completion and progress callbacks fire from that thread the
 * way a real runtime's I/O threads would.
 *
 * Example:
 * @code
 * tether::LoopbackRuntime runtime;
 * auto native = runtime.start([](tether::LoopbackRuntime::Context &ctx) {
 *     ctx.set_result(42);
 *     return TETHER_ERROR_NONE;
 * });
 * auto answer = tether::bridge<int>(std::move(native),
 *                                   tether::LoopbackRuntime::extractor<int>());
 * answer.get();   // 42
 * @endcode
 */

#ifndef TETHER_LOOPBACK_HPP
#define TETHER_LOOPBACK_HPP

#include <tether.h>
#include <tether/handle.hpp>

#include <any>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tether {

namespace detail {
struct LoopbackOp;
}

class LoopbackRuntime {
  public:
    /**
     * Worker-side view of one running operation
     */
    class Context {
      public:
        /**
         * Check if cancellation was requested through the future or controller
         */
        [[nodiscard]] bool canceled() const noexcept;

        /**
         * Report progress to the installed progress callback
         *
         * Blocks while the transfer is paused (until resumed or canceled).
         */
        void report_progress(long long bytes, long long total);

        /**
         * Store the result payload returned through result()
         */
        void set_result(std::any value);

        /**
         * Store the message returned through error_message()
         */
        void set_error_message(std::string message);

      private:
        friend class LoopbackRuntime;

        explicit Context(std::shared_ptr<detail::LoopbackOp> op) noexcept : op_(std::move(op)) {}

        std::shared_ptr<detail::LoopbackOp> op_;
    };

    /// Body of an operation; returns the native error code
    using Work = std::function<int(Context &)>;

    LoopbackRuntime();

    /// Joins every worker thread
    ~LoopbackRuntime();

    LoopbackRuntime(const LoopbackRuntime &) = delete;
    LoopbackRuntime &operator=(const LoopbackRuntime &) = delete;

    /**
     * Start an operation
     *
     * A work function that throws completes with error -1 and the
     * exception's message.
     */
    [[nodiscard]] NativeFuture start(Work work);

    /**
     * Start an operation with a transfer controller
     *
     * The worker waits until the controller's progress callback is
     * installed or the controller is released.
     */
    [[nodiscard]] std::pair<NativeFuture, NativeController> start_transfer(Work work);

    /**
     * Count handles (futures and controllers) not released yet
     */
    [[nodiscard]] size_t live_handles() const noexcept {
        return live_handles_.load(std::memory_order_acquire);
    }

    /**
     * Block until every operation started so far has completed
     */
    void drain();

    /**
     * Count worker threads not joined yet
     *
     * Workers that finished are joined on the next start() or
     * start_transfer(), so this stays near the number of operations still
     * running.
     */
    [[nodiscard]] size_t tracked_workers();

    [[nodiscard]] static const tether_future_ops_t &future_ops() noexcept;
    [[nodiscard]] static const tether_controller_ops_t &controller_ops() noexcept;

    /**
     * Extractor reading a result stored with Context::set_result()
     *
     * The returned callable throws std::bad_any_cast if the stored type is
     * not R.
     */
    template <typename R> [[nodiscard]] static auto extractor() {
        return [](const NativeFuture &native) -> R {
            const auto *slot = static_cast<const std::any *>(native.result());
            if (!slot) {
                throw std::bad_any_cast();
            }
            return std::any_cast<R>(*slot);
        };
    }

  private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<detail::LoopbackOp> launch(Work work, bool with_controller);

    /// Join workers whose body returned; caller holds workers_mutex_
    void reap_finished();

    std::atomic<size_t> live_handles_{0};
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace tether

#endif // TETHER_LOOPBACK_HPP
