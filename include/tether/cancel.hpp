/**
 * @file cancel.hpp
 * @brief Cooperative cancellation signal for bridged operations
 *
 * Example:
 * @code
 * tether::CancelSource source;
 * auto result = tether::bridge<int>(std::move(future), extract, source.token());
 * // ... from any thread:
 * source.request_cancel();   // forwarded to the runtime, best-effort
 * result.wait();             // resolves Canceled once the runtime delivers
 * @endcode
 */

#ifndef TETHER_CANCEL_HPP
#define TETHER_CANCEL_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace tether {

namespace detail {

/**
 * Shared state behind a CancelSource and its tokens
 *
 * At most one handler (one in-flight operation) is bound at a time.
 */
struct CancelState {
    std::mutex mutex;
    std::atomic<bool> requested{false};
    std::function<void()> handler;
    bool bound = false;
};

} // namespace detail

/**
 * Read-only view of a cancellation signal
 *
 * A default-constructed token can never be cancelled.  Copies share state.
 */
class CancelToken {
  public:
    CancelToken() noexcept = default;

    /**
     * Check if this token is connected to a CancelSource
     */
    [[nodiscard]] bool can_be_canceled() const noexcept { return state_ != nullptr; }

    /**
     * Check if cancellation has been requested
     */
    [[nodiscard]] bool is_cancel_requested() const noexcept {
        return state_ && state_->requested.load(std::memory_order_acquire);
    }

    /**
     * Bind the in-flight operation's cancel handler
     *
     * If cancellation was already requested the handler runs immediately on
     * the calling thread.  Used by CompletionBridge.
     *
     * @return False if another operation is already bound to this token
     */
    bool bind(std::function<void()> handler) {
        if (!state_) {
            return true;
        }
        bool run_now = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->bound) {
                return false;
            }
            state_->bound = true;
            if (state_->requested.load(std::memory_order_acquire)) {
                run_now = true;
            } else {
                state_->handler = handler;
            }
        }
        if (run_now && handler) {
            handler();
        }
        return true;
    }

    /**
     * Detach the bound handler (after delivery)
     */
    void unbind() noexcept {
        if (!state_) {
            return;
        }
        std::function<void()> old;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            old = std::move(state_->handler);
            state_->handler = nullptr;
            state_->bound = false;
        }
    }

  private:
    friend class CancelSource;

    explicit CancelToken(std::shared_ptr<detail::CancelState> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

/**
 * Owner of a cancellation signal
 *
 * request_cancel() is thread-safe and only the first call has an effect.
 * Cancellation is cooperative: it signals intent and the runtime decides
 * when (and whether) the operation actually stops.
 */
class CancelSource {
  public:
    CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

    /**
     * Get a token observing this source
     */
    [[nodiscard]] CancelToken token() const noexcept { return CancelToken(state_); }

    /**
     * Signal cancellation
     *
     * Runs the bound handler, if any, on the calling thread.
     *
     * @return True if this call signalled (false if already requested)
     */
    bool request_cancel() {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->requested.exchange(true, std::memory_order_acq_rel)) {
                return false;
            }
            handler = state_->handler;
        }
        // Outside the lock: the handler may complete the operation, which
        // unbinds from this source.
        if (handler) {
            handler();
        }
        return true;
    }

    /**
     * Check if cancellation has been requested
     */
    [[nodiscard]] bool is_cancel_requested() const noexcept {
        return state_->requested.load(std::memory_order_acquire);
    }

  private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace tether

#endif // TETHER_CANCEL_HPP
