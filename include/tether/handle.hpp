/**
 * @file handle.hpp
 * @brief Owning wrappers for native futures and transfer controllers
 */

#ifndef TETHER_HANDLE_HPP
#define TETHER_HANDLE_HPP

#include <tether.h>

#include <string>
#include <utility>

namespace tether {

/**
 * Owning reference to a native pending operation
 *
 * Single owner: whoever holds the NativeFuture is the only party allowed
 * to release the handle.  release() is idempotent and also runs from the
 * destructor, so every exit path disposes the handle exactly once.
 *
 * Not thread-safe on its own; CompletionBridge serializes access between
 * the delivery thread and the cancelling thread.
 */
class NativeFuture {
  public:
    NativeFuture() noexcept = default;

    /**
     * Take ownership of a native future
     *
     * @param ops    Runtime function table (must outlive the handle)
     * @param future Native handle (may be null: treated as never started)
     */
    NativeFuture(const tether_future_ops_t *ops, tether_future_t *future) noexcept
        : ops_(ops), future_(ops ? future : nullptr) {}

    NativeFuture(NativeFuture &&other) noexcept
        : ops_(std::exchange(other.ops_, nullptr)), future_(std::exchange(other.future_, nullptr)) {}

    NativeFuture &operator=(NativeFuture &&other) noexcept {
        if (this != &other) {
            release();
            ops_ = std::exchange(other.ops_, nullptr);
            future_ = std::exchange(other.future_, nullptr);
        }
        return *this;
    }

    NativeFuture(const NativeFuture &) = delete;
    NativeFuture &operator=(const NativeFuture &) = delete;

    ~NativeFuture() { release(); }

    /**
     * Current native status
     * @return TETHER_STATUS_INVALID once released or when empty
     */
    [[nodiscard]] tether_status_t status() const noexcept {
        return future_ ? ops_->status(future_) : TETHER_STATUS_INVALID;
    }

    /**
     * Check if the handle refers to a started operation
     */
    [[nodiscard]] bool valid() const noexcept { return status() != TETHER_STATUS_INVALID; }

    /**
     * Native error code (0 = success)
     */
    [[nodiscard]] int error() const noexcept { return future_ ? ops_->error(future_) : 0; }

    /**
     * Native error message (empty if none)
     */
    [[nodiscard]] std::string error_message() const {
        if (!future_ || !ops_->error_message) {
            return {};
        }
        const char *msg = ops_->error_message(future_);
        return msg ? std::string(msg) : std::string();
    }

    /**
     * Raw result payload
     * @return Runtime-defined pointer, or nullptr
     */
    [[nodiscard]] const void *result() const noexcept {
        return future_ && ops_->result ? ops_->result(future_) : nullptr;
    }

    /**
     * Result payload reinterpreted as R
     *
     * The runtime defines what result() points to; the extractor supplied
     * to bridge() is expected to know the type.
     */
    template <typename R> [[nodiscard]] const R *result_as() const noexcept {
        return static_cast<const R *>(result());
    }

    /**
     * Register the native completion callback
     * @return 0 on success, nonzero if the runtime refused
     */
    [[nodiscard]] int on_completion(tether_completion_fn fn, int token) noexcept {
        if (!future_ || !ops_->on_completion) {
            return -1;
        }
        return ops_->on_completion(future_, fn, token);
    }

    /**
     * Forward a cancellation request (best-effort)
     * @return True if the runtime accepted the request
     */
    bool cancel() noexcept {
        if (!future_ || !ops_->cancel) {
            return false;
        }
        return ops_->cancel(future_) == 0;
    }

    /**
     * Release the native handle
     *
     * Idempotent.  After the first call the handle is never dereferenced
     * again.
     */
    void release() noexcept {
        if (future_) {
            tether_future_t *f = std::exchange(future_, nullptr);
            if (ops_->release) {
                ops_->release(f);
            }
        }
    }

    /**
     * Check whether the handle has been released (or was never set)
     */
    [[nodiscard]] bool released() const noexcept { return future_ == nullptr; }

    /**
     * Get underlying native handle
     */
    [[nodiscard]] tether_future_t *handle() noexcept { return future_; }
    [[nodiscard]] const tether_future_t *handle() const noexcept { return future_; }

  private:
    const tether_future_ops_t *ops_ = nullptr;
    tether_future_t *future_ = nullptr;
};

/**
 * Owning reference to a native transfer controller
 *
 * Same ownership rules as NativeFuture.
 */
class NativeController {
  public:
    NativeController() noexcept = default;

    NativeController(const tether_controller_ops_t *ops, tether_controller_t *controller) noexcept
        : ops_(ops), controller_(ops ? controller : nullptr) {}

    NativeController(NativeController &&other) noexcept
        : ops_(std::exchange(other.ops_, nullptr)),
          controller_(std::exchange(other.controller_, nullptr)) {}

    NativeController &operator=(NativeController &&other) noexcept {
        if (this != &other) {
            release();
            ops_ = std::exchange(other.ops_, nullptr);
            controller_ = std::exchange(other.controller_, nullptr);
        }
        return *this;
    }

    NativeController(const NativeController &) = delete;
    NativeController &operator=(const NativeController &) = delete;

    ~NativeController() { release(); }

    /**
     * Install the progress callback
     * @return True on success
     */
    bool set_progress_callback(tether_progress_fn fn, void *user_data) noexcept {
        if (!controller_ || !ops_->set_progress_callback) {
            return false;
        }
        return ops_->set_progress_callback(controller_, fn, user_data) == 0;
    }

    bool cancel() noexcept {
        return controller_ && ops_->cancel && ops_->cancel(controller_) == 0;
    }

    bool pause() noexcept { return controller_ && ops_->pause && ops_->pause(controller_) == 0; }

    bool resume() noexcept {
        return controller_ && ops_->resume && ops_->resume(controller_) == 0;
    }

    /// True when the runtime implements pause/resume
    [[nodiscard]] bool supports_pause() const noexcept {
        return controller_ && ops_->pause && ops_->resume;
    }

    void release() noexcept {
        if (controller_) {
            tether_controller_t *c = std::exchange(controller_, nullptr);
            if (ops_->release) {
                ops_->release(c);
            }
        }
    }

    [[nodiscard]] bool released() const noexcept { return controller_ == nullptr; }

    [[nodiscard]] explicit operator bool() const noexcept { return controller_ != nullptr; }

    [[nodiscard]] tether_controller_t *handle() noexcept { return controller_; }
    [[nodiscard]] const tether_controller_t *handle() const noexcept { return controller_; }

  private:
    const tether_controller_ops_t *ops_ = nullptr;
    tether_controller_t *controller_ = nullptr;
};

} // namespace tether

#endif // TETHER_HANDLE_HPP
