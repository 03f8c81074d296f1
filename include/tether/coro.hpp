/**
 * @file coro.hpp
 * @brief C++20 coroutine task type for composing bridged operations
 *
 * Future<T> is directly awaitable; Task<T> lets several awaits be chained in
 * one coroutine and awaited in turn.
 *
 * @warning COROUTINE LIFETIME REQUIREMENT
 * The Task object must remain alive until the coroutine completes.  A Task
 * suspended on a Future is resumed on the thread that resolves the Future;
 * destroying the Task before that happens is undefined behavior.
 *
 * Example:
 * @code
 * tether::Task<std::string> fetch_name(Storage &storage) {
 *     Metadata meta = co_await storage.get_metadata("a/b");
 *     co_return meta.name;
 * }
 *
 * auto task = fetch_name(storage);
 * task.resume();            // runs until the first pending Future
 * // ... native runtime completes the operation on its own thread ...
 * while (!task.done()) { std::this_thread::yield(); }
 * std::string name = task.get();
 * @endcode
 */

#ifndef TETHER_CORO_HPP
#define TETHER_CORO_HPP

#include <tether/fwd.hpp>
#include <tether/future.hpp>

#include <atomic>
#include <coroutine>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace tether {

namespace detail {

/**
 * Promise state shared by Task<T> and Task<void>
 *
 * final_suspend transfers control to the awaiting coroutine, if any.
 */
struct TaskPromiseBase {
    std::coroutine_handle<> continuation;
    std::atomic<bool> finished{false};

    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
            auto &promise = h.promise();
            promise.finished.store(true, std::memory_order_release);
            if (promise.continuation) {
                return promise.continuation;
            }
            return std::noop_coroutine();
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }
};

} // namespace detail

/**
 * Lazy coroutine producing a value of type T
 *
 * Starts on the first resume() or co_await.  For void tasks, use Task<void>
 * or just Task<>.
 */
template <typename T> class Task {
  public:
    struct promise_type : detail::TaskPromiseBase {
        std::variant<std::monostate, T, std::exception_ptr> result;

        Task get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        void return_value(T value) { result.template emplace<1>(std::move(value)); }

        void unhandled_exception() { result.template emplace<2>(std::current_exception()); }
    };

    Task() = default;
    explicit Task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    Task(Task &&other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)),
          started_(std::exchange(other.started_, false)) {}

    Task &operator=(Task &&other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
            started_ = std::exchange(other.started_, false);
        }
        return *this;
    }

    ~Task() {
        if (handle_) handle_.destroy();
    }

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    /**
     * Start the coroutine (no-op once started)
     * @return True if the coroutine is still running
     */
    bool resume() {
        if (handle_ && !started_) {
            started_ = true;
            handle_.resume();
        }
        return !done();
    }

    /**
     * Check if the coroutine ran to completion
     *
     * Safe to poll from another thread than the one resuming the coroutine.
     */
    [[nodiscard]] bool done() const noexcept {
        return !handle_ || handle_.promise().finished.load(std::memory_order_acquire);
    }

    /**
     * Get the result (after the coroutine completes)
     * @throws std::logic_error if not complete
     * @throws Any exception thrown inside the coroutine (tether::Error included)
     */
    T get() {
        if (!handle_ || !done()) {
            throw std::logic_error("Task not complete");
        }
        auto &result = handle_.promise().result;
        if (std::holds_alternative<std::exception_ptr>(result)) {
            std::rethrow_exception(std::get<std::exception_ptr>(result));
        }
        return std::move(std::get<T>(result));
    }

    /**
     * Awaiter for co_await on Task
     *
     * Starts the task and resumes the awaiter when it finishes.
     */
    auto operator co_await() {
        started_ = true;
        struct Awaiter {
            std::coroutine_handle<promise_type> handle;

            bool await_ready() const noexcept { return !handle || handle.done(); }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
                handle.promise().continuation = caller;
                return handle;
            }

            T await_resume() {
                auto &result = handle.promise().result;
                if (std::holds_alternative<std::exception_ptr>(result)) {
                    std::rethrow_exception(std::get<std::exception_ptr>(result));
                }
                return std::move(std::get<T>(result));
            }
        };
        return Awaiter{handle_};
    }

  private:
    std::coroutine_handle<promise_type> handle_;
    bool started_ = false;
};

/**
 * Specialization for void tasks
 */
template <> class Task<void> {
  public:
    struct promise_type : detail::TaskPromiseBase {
        std::exception_ptr exception;

        Task get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        void return_void() {}

        void unhandled_exception() { exception = std::current_exception(); }
    };

    Task() = default;
    explicit Task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    Task(Task &&other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)),
          started_(std::exchange(other.started_, false)) {}

    Task &operator=(Task &&other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
            started_ = std::exchange(other.started_, false);
        }
        return *this;
    }

    ~Task() {
        if (handle_) handle_.destroy();
    }

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    bool resume() {
        if (handle_ && !started_) {
            started_ = true;
            handle_.resume();
        }
        return !done();
    }

    [[nodiscard]] bool done() const noexcept {
        return !handle_ || handle_.promise().finished.load(std::memory_order_acquire);
    }

    void get() {
        if (!handle_ || !done()) {
            throw std::logic_error("Task not complete");
        }
        if (handle_.promise().exception) {
            std::rethrow_exception(handle_.promise().exception);
        }
    }

    auto operator co_await() {
        started_ = true;
        struct Awaiter {
            std::coroutine_handle<promise_type> handle;

            bool await_ready() const noexcept { return !handle || handle.done(); }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
                handle.promise().continuation = caller;
                return handle;
            }

            void await_resume() {
                if (handle.promise().exception) {
                    std::rethrow_exception(handle.promise().exception);
                }
            }
        };
        return Awaiter{handle_};
    }

  private:
    std::coroutine_handle<promise_type> handle_;
    bool started_ = false;
};

} // namespace tether

#endif // TETHER_CORO_HPP
