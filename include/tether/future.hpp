/**
 * @file future.hpp
 * @brief Awaitable result of a bridged native operation
 *
 * A Future<T> resolves exactly once to one of:
 * - Succeeded: value() holds the extracted result
 * - Canceled:  the caller asked to cancel (distinguishable from failure)
 * - Failed:    error() describes a domain error or bridging failure
 *
 * Consumers may block (wait/get), attach continuations (then) or co_await
 * from a coroutine.  Continuations run on the thread that resolves the
 * future, which is normally a native runtime thread.
 */

#ifndef TETHER_FUTURE_HPP
#define TETHER_FUTURE_HPP

#include <tether/error.hpp>
#include <tether/fwd.hpp>
#include <tether/log.hpp>

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tether {

/**
 * Resolution state of a Future
 */
enum class ResultState {
    Pending,   ///< Not resolved yet
    Succeeded, ///< Resolved with a value
    Canceled,  ///< Resolved as canceled
    Failed     ///< Resolved with an error
};

/// Return a short name for the given state
[[nodiscard]] inline const char *result_state_name(ResultState state) noexcept {
    switch (state) {
    case ResultState::Pending:
        return "Pending";
    case ResultState::Succeeded:
        return "Succeeded";
    case ResultState::Canceled:
        return "Canceled";
    case ResultState::Failed:
        return "Failed";
    default:
        return "???";
    }
}

namespace detail {

template <typename T> class SharedState {
  public:
    /// @return False if already resolved
    bool resolve_value(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != ResultState::Pending) {
            return false;
        }
        value_.emplace(std::move(value));
        state_ = ResultState::Succeeded;
        finish(lock);
        return true;
    }

    /// @return False if already resolved
    bool resolve_error(Error error) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != ResultState::Pending) {
            return false;
        }
        state_ = error.is_canceled() ? ResultState::Canceled : ResultState::Failed;
        error_.emplace(std::move(error));
        finish(lock);
        return true;
    }

    /**
     * Run fn once resolved
     * @return True if fn was queued, false if already resolved (fn not run)
     */
    bool enqueue(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ResultState::Pending) {
            return false;
        }
        continuations_.push_back(std::move(fn));
        return true;
    }

    [[nodiscard]] ResultState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return state_ != ResultState::Pending; });
    }

    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return state_ != ResultState::Pending; });
    }

    // Only valid once resolved; value_/error_ are immutable from then on.
    [[nodiscard]] const std::optional<T> &value() const noexcept { return value_; }
    [[nodiscard]] const std::optional<Error> &error() const noexcept { return error_; }

  private:
    void finish(std::unique_lock<std::mutex> &lock) {
        auto continuations = std::move(continuations_);
        continuations_.clear();
        lock.unlock();
        cv_.notify_all();
        for (auto &fn : continuations) {
            try {
                fn();
            } catch (const std::exception &e) {
                log_emit(LogLevel::Error, std::string("future continuation threw: ") + e.what());
            } catch (...) {
                log_emit(LogLevel::Error, "future continuation threw: unknown exception");
            }
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    ResultState state_ = ResultState::Pending;
    std::optional<T> value_;
    std::optional<Error> error_;
    std::vector<std::function<void()>> continuations_;
};

} // namespace detail

/**
 * Consumer side of an awaitable result
 *
 * Copyable; copies observe the same result.
 */
template <typename T> class Future {
  public:
    Future() noexcept = default;

    /**
     * Check if the future is attached to a result
     */
    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    /**
     * Current resolution state
     */
    [[nodiscard]] ResultState state() const {
        check_valid();
        return state_->state();
    }

    /**
     * Check if resolved (in any terminal state)
     */
    [[nodiscard]] bool ready() const { return state() != ResultState::Pending; }

    /**
     * Block until resolved
     */
    void wait() const {
        check_valid();
        state_->wait();
    }

    /**
     * Block until resolved or timeout expires
     * @return True if resolved
     */
    bool wait_for(std::chrono::milliseconds timeout) const {
        check_valid();
        return state_->wait_for(timeout);
    }

    /**
     * Wait for and return the value
     * @throws Error if the operation was canceled or failed
     */
    const T &get() const {
        wait();
        if (state_->state() != ResultState::Succeeded) {
            throw *state_->error();
        }
        return *state_->value();
    }

    /**
     * Get the value of a succeeded future
     * @throws std::logic_error if not Succeeded
     */
    [[nodiscard]] const T &value() const {
        if (state() != ResultState::Succeeded) {
            throw std::logic_error("Future has no value");
        }
        return *state_->value();
    }

    /**
     * Get the error of a canceled or failed future
     * @throws std::logic_error if not Canceled or Failed
     */
    [[nodiscard]] const Error &error() const {
        ResultState s = state();
        if (s != ResultState::Canceled && s != ResultState::Failed) {
            throw std::logic_error("Future has no error");
        }
        return *state_->error();
    }

    /**
     * Attach a continuation
     *
     * fn(const Future<T>&) runs once resolved, on the resolving thread, or
     * immediately on the calling thread if already resolved.  Exceptions
     * thrown by fn are logged, never propagated to the resolving thread.
     */
    template <typename F> void then(F &&fn) const {
        check_valid();
        auto state = state_;
        auto call = [state, fn = std::forward<F>(fn)]() mutable { fn(Future<T>(state)); };
        if (!state_->enqueue(call)) {
            call();
        }
    }

    /**
     * Awaiter for co_await on Future
     *
     * Resumes the awaiting coroutine on the resolving thread.
     * @throws Error from co_await if the operation was canceled or failed
     */
    auto operator co_await() const {
        check_valid();
        struct Awaiter {
            std::shared_ptr<detail::SharedState<T>> state;

            bool await_ready() const { return state->state() != ResultState::Pending; }

            bool await_suspend(std::coroutine_handle<> handle) {
                // False when resolution won the race: resume immediately.
                return state->enqueue([handle]() { handle.resume(); });
            }

            T await_resume() {
                if (state->state() != ResultState::Succeeded) {
                    throw *state->error();
                }
                return *state->value();
            }
        };
        return Awaiter{state_};
    }

  private:
    friend class Promise<T>;

    explicit Future(std::shared_ptr<detail::SharedState<T>> state) noexcept
        : state_(std::move(state)) {}

    void check_valid() const {
        if (!state_) {
            throw std::logic_error("Future has no state");
        }
    }

    std::shared_ptr<detail::SharedState<T>> state_;
};

/**
 * Producer side of an awaitable result
 *
 * Exactly one of set_value / set_canceled / set_error may be called;
 * a second resolution is a programming error.
 */
template <typename T> class Promise {
  public:
    Promise() : state_(std::make_shared<detail::SharedState<T>>()) {}

    /**
     * Get a future observing this promise
     */
    [[nodiscard]] Future<T> future() const { return Future<T>(state_); }

    /**
     * Resolve Succeeded
     * @throws std::logic_error if already resolved
     */
    void set_value(T value) {
        if (!state_->resolve_value(std::move(value))) {
            throw std::logic_error("Promise already resolved");
        }
    }

    /**
     * Resolve Canceled
     * @throws std::logic_error if already resolved
     */
    void set_canceled() { set_error(Error::canceled()); }

    /**
     * Resolve Failed (or Canceled if error.is_canceled())
     * @throws std::logic_error if already resolved
     */
    void set_error(Error error) {
        if (!state_->resolve_error(std::move(error))) {
            throw std::logic_error("Promise already resolved");
        }
    }

    /**
     * Check if already resolved
     */
    [[nodiscard]] bool resolved() const { return state_->state() != ResultState::Pending; }

  private:
    std::shared_ptr<detail::SharedState<T>> state_;
};

/**
 * Create an already-resolved Future
 */
template <typename T> [[nodiscard]] Future<T> make_ready_future(T value) {
    Promise<T> promise;
    promise.set_value(std::move(value));
    return promise.future();
}

/**
 * Create an already-failed (or canceled) Future
 */
template <typename T> [[nodiscard]] Future<T> make_failed_future(Error error) {
    Promise<T> promise;
    promise.set_error(std::move(error));
    return promise.future();
}

} // namespace tether

#endif // TETHER_FUTURE_HPP
