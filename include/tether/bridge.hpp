/**
 * @file bridge.hpp
 * @brief Adapter from a pending native operation to an awaitable Future
 *
 * Example:
 * @code
 * tether::NativeFuture native(&storage_ops, storage_get_metadata(path));
 * auto metadata = tether::bridge<Metadata>(
 *     std::move(native),
 *     [](const tether::NativeFuture &f) { return *f.result_as<Metadata>(); },
 *     cancel.token(),
 *     tether::Options().name("GetMetadata"));
 *
 * metadata.then([](const tether::Future<Metadata> &m) { ... });
 * @endcode
 */

#ifndef TETHER_BRIDGE_HPP
#define TETHER_BRIDGE_HPP

#include <tether.h>
#include <tether/cancel.hpp>
#include <tether/classify.hpp>
#include <tether/detail/callback_registry.hpp>
#include <tether/error.hpp>
#include <tether/future.hpp>
#include <tether/handle.hpp>
#include <tether/log.hpp>
#include <tether/options.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tether {

/**
 * One native operation being turned into one Future resolution
 *
 * Lifecycle:
 * 1. create() takes ownership of the NativeFuture
 * 2. optional hooks are installed (used by bridge_transfer)
 * 3. start() registers the completion callback with the native runtime
 * 4. the runtime calls back on its own thread; the outcome is classified,
 *    hooks run, the handle is released and the Future resolves
 *
 * The completion closure parked in the CallbackRegistry keeps the bridge
 * alive, so dropping the returned Future never leaks the native handle: it
 * is still released when the runtime delivers.
 *
 * Cancellation requested before delivery is forwarded to the runtime but
 * does not resolve anything locally.  The outcome is Canceled once the
 * runtime delivers, whatever the runtime reported.
 *
 * @tparam T Value type produced by the extractor
 */
template <typename T>
class CompletionBridge : public std::enable_shared_from_this<CompletionBridge<T>> {
  public:
    /// Reads the value out of a completed handle; may throw
    using Extractor = std::function<T(const NativeFuture &)>;
    /// Runs after classification, before disposal.  value is null unless Succeeded.
    using SettleHook = std::function<void(const Classification &, const T *value)>;
    using Hook = std::function<void()>;

    /**
     * Create a bridge (not started)
     *
     * @param native  Handle to take ownership of
     * @param extract Value extractor invoked on success
     * @param cancel  Cancellation signal (default: never canceled)
     * @param options Per-operation options
     */
    [[nodiscard]] static std::shared_ptr<CompletionBridge>
    create(NativeFuture native, Extractor extract, CancelToken cancel = {},
           const Options &options = {}) {
        return std::shared_ptr<CompletionBridge>(new CompletionBridge(
            std::move(native), std::move(extract), std::move(cancel), options));
    }

    CompletionBridge(const CompletionBridge &) = delete;
    CompletionBridge &operator=(const CompletionBridge &) = delete;

    /// Install the hook run once the outcome is known.  Call before start().
    void on_settle(SettleHook hook) { settle_hook_ = std::move(hook); }

    /// Install the hook run when cancellation is forwarded.  Call before start().
    void on_cancel(Hook hook) { cancel_hook_ = std::move(hook); }

    /// Install the hook run right after the handle is released.  Call before start().
    void on_disposed(Hook hook) { dispose_hook_ = std::move(hook); }

    /**
     * Get the future this bridge resolves
     */
    [[nodiscard]] Future<T> future() const { return promise_.future(); }

    /**
     * Register with the native runtime
     *
     * Never throws for native-side failures: an invalid handle or a refused
     * registration resolves the future Failed(UnknownFailure).  A cancel
     * token already bound to another operation rejects this one (see
     * reject()); it is not an immediate failure because the native side is
     * already running.
     */
    void start() {
        auto self = this->shared_from_this();

        if (!native_.valid()) {
            fail("operation not started");
            return;
        }

        std::weak_ptr<CompletionBridge> weak = self;
        if (cancel_.bind([weak]() {
                if (auto bridge = weak.lock()) {
                    bridge->request_cancel();
                }
            })) {
            bound_ = true;
        } else {
            reject("cancel token is already bound to another operation");
        }

        auto &registry = detail::CallbackRegistry::instance();
        int token = 0;
        try {
            token = registry.add([self]() { self->deliver(); });
        } catch (const std::exception &e) {
            fail(std::string("cannot register completion: ") + e.what());
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token_ = token;
        }

        if (native_.on_completion(tether_detail_completion_trampoline, token) != 0) {
            // If remove() loses, a delivery already claimed the token and
            // the bridge resolves through it.
            if (registry.remove(token)) {
                fail("native runtime refused the completion callback");
            }
            return;
        }

        bool rejected = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rejected = rejection_.has_value();
        }
        if (rejected) {
            request_cancel();
        }
    }

    /**
     * Fail the operation once the runtime delivers
     *
     * The native operation still runs to completion (cancellation is
     * requested at start()) and the handle is released only after delivery;
     * the future then resolves Failed(UnknownFailure, reason) whatever the
     * runtime reported.  Call before start().
     */
    void reject(std::string reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!rejection_) {
            rejection_ = std::move(reason);
        }
    }

    /**
     * Forward cancellation to the native runtime (best-effort)
     *
     * No-op once delivered or after the first request.  Safe to call from any
     * thread, including from inside the runtime's cancel path.
     */
    void request_cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (settled_ || cancel_requested_) {
                return;
            }
            cancel_requested_ = true;
            forwarding_ = true;
        }

        // Without the lock: the runtime may deliver synchronously from cancel.
        native_.cancel();
        if (cancel_hook_) {
            run_hook("cancel", cancel_hook_);
        }

        bool dispose_now = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            forwarding_ = false;
            dispose_now = std::exchange(dispose_deferred_, false);
        }
        if (dispose_now) {
            dispose();
        }
    }

    /**
     * Check whether the outcome is known
     */
    [[nodiscard]] bool settled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_;
    }

    /**
     * Check whether cancellation was forwarded
     */
    [[nodiscard]] bool cancel_requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_requested_;
    }

    /**
     * Get the registry token (0 until registered)
     */
    [[nodiscard]] int token() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return token_;
    }

  private:
    CompletionBridge(NativeFuture native, Extractor extract, CancelToken cancel,
                     const Options &options)
        : native_(std::move(native)), extract_(std::move(extract)), cancel_(std::move(cancel)),
          options_(options) {}

    /// Called exactly once through the registry
    void deliver() {
        Classification outcome;
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (settled_) {
                return;
            }
            settled_ = true;
            if (rejection_) {
                outcome = {ErrorKind::UnknownFailure, 0, *rejection_};
            } else {
                bool canceled = cancel_requested_ || cancel_.is_cancel_requested();
                outcome = classify(native_.status(), native_.error(), native_.error_message(),
                                   canceled, options_.c_options().canceled_code);
            }
            if (outcome.ok()) {
                try {
                    value.emplace(extract_(native_));
                } catch (const std::exception &e) {
                    outcome = {ErrorKind::UnknownFailure, 0,
                               std::string("result extraction failed: ") + e.what()};
                } catch (...) {
                    outcome = {ErrorKind::UnknownFailure, 0,
                               "result extraction failed: unknown exception"};
                }
            }
        }
        complete(std::move(outcome), std::move(value));
    }

    void fail(std::string message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settled_ = true;
        }
        complete({ErrorKind::UnknownFailure, 0, std::move(message)}, std::nullopt);
    }

    void complete(Classification outcome, std::optional<T> value) {
        if (bound_) {
            cancel_.unbind();
            bound_ = false;
        }

        if (settle_hook_) {
            try {
                settle_hook_(outcome, value ? &*value : nullptr);
            } catch (const std::exception &e) {
                log_emit(LogLevel::Error, options_.name(),
                         std::string("settle hook threw: ") + e.what());
            } catch (...) {
                log_emit(LogLevel::Error, options_.name(), "settle hook threw: unknown exception");
            }
        }

        bool dispose_now = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (forwarding_) {
                // request_cancel() is still talking to the handle
                dispose_deferred_ = true;
                dispose_now = false;
            }
        }
        if (dispose_now) {
            dispose();
        }

        detail::log_outcome(options_.name(), outcome, options_.c_options().log_outcomes);

        if (value) {
            promise_.set_value(std::move(*value));
        } else {
            promise_.set_error(outcome.to_error());
        }
    }

    void dispose() {
        native_.release();
        if (dispose_hook_) {
            run_hook("dispose", dispose_hook_);
        }
    }

    void run_hook(const char *what, const Hook &hook) {
        try {
            hook();
        } catch (const std::exception &e) {
            log_emit(LogLevel::Error, options_.name(),
                     std::string(what) + " hook threw: " + e.what());
        } catch (...) {
            log_emit(LogLevel::Error, options_.name(),
                     std::string(what) + " hook threw: unknown exception");
        }
    }

    mutable std::mutex mutex_;
    NativeFuture native_;
    Extractor extract_;
    CancelToken cancel_;
    Options options_;
    Promise<T> promise_;

    SettleHook settle_hook_;
    Hook cancel_hook_;
    Hook dispose_hook_;

    std::optional<std::string> rejection_;
    int token_ = 0;
    bool bound_ = false; // only touched by start() and the single completion path
    bool settled_ = false;
    bool cancel_requested_ = false;
    bool forwarding_ = false;
    bool dispose_deferred_ = false;
};

/**
 * Bridge a native pending operation to a Future
 *
 * @param native  Handle to take ownership of (released exactly once)
 * @param extract Callable T(const NativeFuture&) reading the result on success
 * @param cancel  Cancellation signal (default: never canceled)
 * @param options Per-operation options
 * @return Future resolving Succeeded, Canceled or Failed; never throws for
 *         native-side failures
 */
template <typename T, typename Extract>
[[nodiscard]] Future<T> bridge(NativeFuture native, Extract &&extract, CancelToken cancel = {},
                               const Options &options = {}) {
    auto op = CompletionBridge<T>::create(std::move(native),
                                          typename CompletionBridge<T>::Extractor(
                                              std::forward<Extract>(extract)),
                                          std::move(cancel), options);
    Future<T> result = op->future();
    op->start();
    return result;
}

/**
 * Extractor copying the runtime's result payload as R
 *
 * @throws std::runtime_error from the extractor if the runtime reported
 *         success without a payload
 */
template <typename R> [[nodiscard]] auto extract_as() {
    return [](const NativeFuture &native) -> R {
        const R *payload = native.template result_as<R>();
        if (!payload) {
            throw std::runtime_error("native result is empty");
        }
        return *payload;
    };
}

} // namespace tether

#endif // TETHER_BRIDGE_HPP
