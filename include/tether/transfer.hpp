/**
 * @file transfer.hpp
 * @brief Progress and state tracking for native uploads and downloads
 *
 * Example:
 * @code
 * auto transfer = tether::bridge_transfer<Metadata>(
 *     std::move(native), std::move(controller), tether::extract_as<Metadata>(),
 *     tether::make_observer([](const tether::TransferProgress &p) {
 *         std::printf("%lld / %lld\n", p.bytes_transferred, p.total_bytes);
 *     }));
 *
 * transfer.pause();
 * transfer.resume();
 * Metadata m = transfer.result().get();
 * @endcode
 */

#ifndef TETHER_TRANSFER_HPP
#define TETHER_TRANSFER_HPP

#include <tether.h>
#include <tether/bridge.hpp>
#include <tether/cancel.hpp>
#include <tether/classify.hpp>
#include <tether/error.hpp>
#include <tether/future.hpp>
#include <tether/handle.hpp>
#include <tether/log.hpp>
#include <tether/options.hpp>

#include <any>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace tether {

/**
 * Coarse state of a transfer
 *
 * Pending -> InProgress -> {Paused <-> InProgress} -> Succeeded | Failed | Canceled
 */
enum class TransferState { Pending, InProgress, Paused, Succeeded, Failed, Canceled };

/// Return a short name for the given state
[[nodiscard]] inline const char *transfer_state_name(TransferState state) noexcept {
    switch (state) {
    case TransferState::Pending:
        return "Pending";
    case TransferState::InProgress:
        return "InProgress";
    case TransferState::Paused:
        return "Paused";
    case TransferState::Succeeded:
        return "Succeeded";
    case TransferState::Failed:
        return "Failed";
    case TransferState::Canceled:
        return "Canceled";
    default:
        return "???";
    }
}

/// True for Succeeded, Failed and Canceled
[[nodiscard]] constexpr bool is_terminal(TransferState state) noexcept {
    return state == TransferState::Succeeded || state == TransferState::Failed ||
           state == TransferState::Canceled;
}

/**
 * Point-in-time view of a transfer
 */
struct TransferProgress {
    long long bytes_transferred = 0;
    long long total_bytes = -1; ///< -1 while unknown
    TransferState state = TransferState::Pending;
    std::any metadata; ///< Result metadata, only set in Succeeded

    [[nodiscard]] bool total_known() const noexcept { return total_bytes >= 0; }

    /// Metadata as M, or nullptr if absent or of another type
    template <typename M> [[nodiscard]] const M *metadata_as() const noexcept {
        return std::any_cast<M>(&metadata);
    }
};

/// Control request a monitor forwards to the native controller
enum class TransferRequest { Cancel, Pause, Resume };

/**
 * Tracks one transfer's bytes, total and state
 *
 * on_progress() and snapshot() are lock-free.  Requests go through the
 * attached forwarder (the native controller); a monitor with nothing
 * attached rejects them.
 */
class TransferMonitor {
  public:
    /// Returns true if the runtime accepted the request
    using Forwarder = std::function<bool(TransferRequest)>;

    /**
     * @param expected_total Size if known up front, -1 otherwise
     */
    explicit TransferMonitor(long long expected_total = -1) noexcept
        : total_(expected_total < 0 ? -1 : expected_total) {}

    TransferMonitor(const TransferMonitor &) = delete;
    TransferMonitor &operator=(const TransferMonitor &) = delete;

    /**
     * Record a progress tick
     *
     * Bytes never exceed a known total and otherwise never decrease.  The
     * first known total sticks; later totals are ignored.  Ticks after a
     * terminal state are dropped.
     */
    void on_progress(long long bytes, long long total) noexcept {
        TransferState s = state_.load(std::memory_order_acquire);
        if (is_terminal(s)) {
            return;
        }

        if (total >= 0) {
            long long unknown = -1;
            total_.compare_exchange_strong(unknown, total, std::memory_order_acq_rel);
        }
        long long known = total_.load(std::memory_order_acquire);
        if (bytes < 0) {
            bytes = 0;
        }
        if (known >= 0 && bytes > known) {
            bytes = known;
        }
        long long current = bytes_.load(std::memory_order_relaxed);
        while (bytes > current &&
               !bytes_.compare_exchange_weak(current, bytes, std::memory_order_acq_rel)) {
        }
        // A total arriving below the recorded bytes pulls them down to it
        if (known >= 0) {
            current = bytes_.load(std::memory_order_relaxed);
            while (current > known &&
                   !bytes_.compare_exchange_weak(current, known, std::memory_order_acq_rel)) {
            }
        }

        if (s == TransferState::Pending) {
            state_.compare_exchange_strong(s, TransferState::InProgress,
                                           std::memory_order_acq_rel);
        }
    }

    /**
     * Ask the runtime to cancel
     *
     * The outcome is only known once the operation settles.  For a monitor
     * created by bridge_transfer() the request goes to the operation's cancel
     * signal, so only the first call returns true.
     *
     * @return True if the attached forwarder took the request
     */
    bool request_cancel() {
        if (is_terminal(state())) {
            return false;
        }
        return forward(TransferRequest::Cancel);
    }

    /**
     * Ask the runtime to pause; InProgress -> Paused on acceptance
     * @return True if the request was forwarded and accepted
     */
    bool request_pause() {
        TransferState s = state();
        if (s != TransferState::InProgress && s != TransferState::Pending) {
            return false;
        }
        if (!forward(TransferRequest::Pause)) {
            return false;
        }
        if (!transition(TransferState::InProgress, TransferState::Paused)) {
            transition(TransferState::Pending, TransferState::Paused);
        }
        return true;
    }

    /**
     * Ask the runtime to resume; Paused -> InProgress on acceptance
     * @return True if the request was forwarded and accepted
     */
    bool request_resume() {
        if (state() != TransferState::Paused) {
            return false;
        }
        if (!forward(TransferRequest::Resume)) {
            return false;
        }
        transition(TransferState::Paused, TransferState::InProgress);
        return true;
    }

    /**
     * Move to a terminal state
     *
     * @param terminal Succeeded, Failed or Canceled
     * @param metadata Published with the state (kept only for Succeeded)
     * @return False if already terminal, or terminal is not a terminal state
     */
    bool finish(TransferState terminal, std::any metadata = {}) {
        if (!is_terminal(terminal) || finishing_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        if (terminal == TransferState::Succeeded) {
            metadata_ = std::move(metadata);
        }
        // Release store publishes metadata_ to snapshot()
        state_.store(terminal, std::memory_order_release);
        return true;
    }

    /**
     * Lock-free view of the current progress
     */
    [[nodiscard]] TransferProgress snapshot() const {
        TransferProgress p;
        p.state = state_.load(std::memory_order_acquire);
        p.total_bytes = total_.load(std::memory_order_acquire);
        p.bytes_transferred = clamped(bytes_.load(std::memory_order_acquire), p.total_bytes);
        if (p.state == TransferState::Succeeded) {
            p.metadata = metadata_;
        }
        return p;
    }

    [[nodiscard]] TransferState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] long long bytes_transferred() const noexcept {
        long long total = total_.load(std::memory_order_acquire);
        return clamped(bytes_.load(std::memory_order_acquire), total);
    }

    [[nodiscard]] long long total_bytes() const noexcept {
        return total_.load(std::memory_order_acquire);
    }

    /**
     * Connect requests to a native controller
     */
    void attach(Forwarder forwarder) {
        std::lock_guard<std::mutex> lock(forward_mutex_);
        forwarder_ = std::move(forwarder);
    }

    /**
     * Disconnect from the controller (after it is released)
     */
    void detach() {
        Forwarder old;
        std::lock_guard<std::mutex> lock(forward_mutex_);
        old = std::move(forwarder_);
        forwarder_ = nullptr;
    }

  private:
    // Covers a reader landing between the total and the bytes being lowered
    static long long clamped(long long bytes, long long total) noexcept {
        return total >= 0 && bytes > total ? total : bytes;
    }

    bool forward(TransferRequest request) {
        Forwarder fn;
        {
            std::lock_guard<std::mutex> lock(forward_mutex_);
            fn = forwarder_;
        }
        return fn && fn(request);
    }

    bool transition(TransferState from, TransferState to) noexcept {
        return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
    }

    std::atomic<long long> bytes_{0};
    std::atomic<long long> total_;
    std::atomic<TransferState> state_{TransferState::Pending};
    std::atomic<bool> finishing_{false};
    std::any metadata_; // written once, before the terminal state is stored

    std::mutex forward_mutex_;
    Forwarder forwarder_;
};

/**
 * Receives progress notifications for one transfer
 *
 * Called on native runtime threads, serialized per transfer.  The last call
 * carries the terminal state.  Exceptions are caught and logged.
 */
class ProgressObserver {
  public:
    virtual ~ProgressObserver() = default;

    virtual void on_progress(const TransferProgress &progress) = 0;
};

namespace detail {

class FunctionObserver : public ProgressObserver {
  public:
    explicit FunctionObserver(std::function<void(const TransferProgress &)> fn)
        : fn_(std::move(fn)) {}

    void on_progress(const TransferProgress &progress) override {
        if (fn_) {
            fn_(progress);
        }
    }

  private:
    std::function<void(const TransferProgress &)> fn_;
};

} // namespace detail

/**
 * Wrap a callable as a ProgressObserver
 */
[[nodiscard]] inline std::shared_ptr<ProgressObserver>
make_observer(std::function<void(const TransferProgress &)> fn) {
    return std::make_shared<detail::FunctionObserver>(std::move(fn));
}

/**
 * Glues a TransferMonitor to a ProgressObserver
 *
 * Every native tick updates the monitor and is forwarded to the observer.
 * finalize() moves the monitor to its terminal state and notifies one last
 * time; ticks arriving afterwards are dropped.
 *
 * The observer is never called with a lock held, so it may control the
 * transfer (cancel, pause) even when the runtime settles the operation
 * synchronously from inside that call.  Notifications are queued and
 * delivered one at a time, in order, by whichever thread is currently
 * notifying.  A re-entrant finalize() therefore returns before its terminal
 * notification, which follows as soon as the observer returns; a finalize()
 * from another thread waits until its notification is delivered.
 */
class TransferStateUpdater : public std::enable_shared_from_this<TransferStateUpdater> {
  public:
    TransferStateUpdater(std::shared_ptr<TransferMonitor> monitor,
                         std::shared_ptr<ProgressObserver> observer = nullptr)
        : monitor_(std::move(monitor)), observer_(std::move(observer)) {}

    TransferStateUpdater(const TransferStateUpdater &) = delete;
    TransferStateUpdater &operator=(const TransferStateUpdater &) = delete;

    /**
     * Handle a native progress tick
     */
    void on_native_progress(long long bytes, long long total) noexcept {
        // The observer may settle the operation, which drops the bridge's
        // references to this updater before the call unwinds.
        auto self = weak_from_this().lock();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finalized_) {
                return;
            }
            monitor_->on_progress(bytes, total);
            queue_.push_back(monitor_->snapshot());
        }
        deliver(false);
    }

    /**
     * Finalize from the bridged operation's outcome
     *
     * @param outcome  Success, Canceled, or a failure kind
     * @param metadata Result metadata (kept only on Success)
     * @return False if already finalized
     */
    bool finalize(ErrorKind outcome, std::any metadata = {}) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finalized_) {
                return false;
            }
            finalized_ = true;

            TransferState terminal = TransferState::Failed;
            if (outcome == ErrorKind::Success) {
                terminal = TransferState::Succeeded;
            } else if (outcome == ErrorKind::Canceled) {
                terminal = TransferState::Canceled;
            }
            monitor_->finish(terminal, std::move(metadata));
            queue_.push_back(monitor_->snapshot());
        }
        deliver(true);
        return true;
    }

    [[nodiscard]] bool finalized() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finalized_;
    }

    [[nodiscard]] const std::shared_ptr<TransferMonitor> &monitor() const noexcept {
        return monitor_;
    }

  private:
    /// Drain the queue unless another call is already draining it
    void deliver(bool wait_for_other) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (notifying_) {
            if (wait_for_other && notifier_ != std::this_thread::get_id()) {
                idle_.wait(lock, [this] { return !notifying_; });
            }
            return;
        }
        notifying_ = true;
        notifier_ = std::this_thread::get_id();
        while (!queue_.empty()) {
            TransferProgress progress = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            notify(progress);
            lock.lock();
        }
        notifying_ = false;
        notifier_ = std::thread::id();
        idle_.notify_all();
    }

    void notify(const TransferProgress &progress) noexcept {
        if (!observer_) {
            return;
        }
        try {
            observer_->on_progress(progress);
        } catch (const std::exception &e) {
            log_emit(LogLevel::Warning, std::string("progress observer threw: ") + e.what());
        } catch (...) {
            log_emit(LogLevel::Warning, "progress observer threw: unknown exception");
        }
    }

    std::shared_ptr<TransferMonitor> monitor_;
    std::shared_ptr<ProgressObserver> observer_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::deque<TransferProgress> queue_;
    bool finalized_ = false;
    bool notifying_ = false;
    std::thread::id notifier_;
};

} // namespace tether

/**
 * C progress trampoline
 *
 * user_data is the TransferStateUpdater registered with the controller; it
 * outlives the controller's release().
 */
extern "C" inline void tether_detail_progress_trampoline(long long bytes, long long total,
                                                         void *user_data) {
    if (!user_data) return;
    static_cast<tether::TransferStateUpdater *>(user_data)->on_native_progress(bytes, total);
}

namespace tether {

namespace detail {

/// Controller shared between the cancel path and the disposal path
struct TransferControl {
    std::mutex mutex;
    NativeController controller;

    bool send(TransferRequest request) {
        std::lock_guard<std::mutex> lock(mutex);
        switch (request) {
        case TransferRequest::Cancel:
            return controller.cancel();
        case TransferRequest::Pause:
            return controller.pause();
        case TransferRequest::Resume:
            return controller.resume();
        }
        return false;
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        controller.release();
    }
};

} // namespace detail

/**
 * Handle on a bridged transfer
 *
 * Copyable; copies control the same transfer.
 */
template <typename T> class Transfer {
  public:
    Transfer(Future<T> result, std::shared_ptr<TransferMonitor> monitor)
        : result_(std::move(result)), monitor_(std::move(monitor)) {}

    [[nodiscard]] const Future<T> &result() const noexcept { return result_; }

    [[nodiscard]] const std::shared_ptr<TransferMonitor> &monitor() const noexcept {
        return monitor_;
    }

    [[nodiscard]] TransferProgress snapshot() const { return monitor_->snapshot(); }

    /// Request cancellation; the result resolves Canceled on delivery
    bool cancel() { return monitor_->request_cancel(); }

    bool pause() { return monitor_->request_pause(); }

    bool resume() { return monitor_->request_resume(); }

  private:
    Future<T> result_;
    std::shared_ptr<TransferMonitor> monitor_;
};

/**
 * Bridge a native transfer: result, progress and controls
 *
 * The controller receives progress through the updater, cancel requests
 * through the bridge and is released right after the native handle.
 * on_settled runs after both releases and before the result resolves; use
 * it to unpin buffers the runtime was reading from or writing into.
 *
 * A cancel token already bound to another operation is not taken over: the
 * transfer is canceled natively and resolves Failed(UnknownFailure) once the
 * runtime delivers, so buffers stay pinned until the runtime is done.
 *
 * @param native         Pending native operation
 * @param controller     Transfer controller for the same operation
 * @param extract        Callable T(const NativeFuture&)
 * @param observer       Progress observer (may be null)
 * @param cancel         External cancellation signal
 * @param options        Per-operation options
 * @param expected_total Size known up front, -1 if unknown
 * @param on_settled     Runs once the operation is fully disposed
 */
template <typename T, typename Extract>
[[nodiscard]] Transfer<T>
bridge_transfer(NativeFuture native, NativeController controller, Extract &&extract,
                std::shared_ptr<ProgressObserver> observer = nullptr, CancelToken cancel = {},
                const Options &options = {}, long long expected_total = -1,
                std::function<void()> on_settled = nullptr) {
    auto monitor = std::make_shared<TransferMonitor>(expected_total);
    auto updater = std::make_shared<TransferStateUpdater>(monitor, std::move(observer));
    auto control = std::make_shared<detail::TransferControl>();
    control->controller = std::move(controller);

    // Transfer::cancel() and the caller's token share one internal source.
    CancelSource source;
    bool external_bound =
        !cancel.can_be_canceled() || cancel.bind([source]() mutable { source.request_cancel(); });

    if (control->controller &&
        !control->controller.set_progress_callback(tether_detail_progress_trampoline,
                                                   updater.get())) {
        log_emit(LogLevel::Warning, options.name(), "progress reporting unavailable");
    }

    auto op = CompletionBridge<T>::create(
        std::move(native), typename CompletionBridge<T>::Extractor(std::forward<Extract>(extract)),
        source.token(), options);
    if (!external_bound) {
        op->reject("cancel token is already bound to another operation");
    }

    op->on_cancel([control]() { control->send(TransferRequest::Cancel); });
    op->on_settle([updater, cancel, external_bound](const Classification &outcome,
                                                    const T *value) mutable {
        if (external_bound) {
            cancel.unbind();
        }
        updater->finalize(outcome.kind, value ? std::any(*value) : std::any());
    });
    op->on_disposed([updater, control, on_settled = std::move(on_settled)]() {
        control->release();
        updater->monitor()->detach();
        if (on_settled) {
            on_settled();
        }
    });

    std::weak_ptr<detail::TransferControl> weak_control = control;
    monitor->attach([weak_control, source](TransferRequest request) mutable {
        if (request == TransferRequest::Cancel) {
            return source.request_cancel();
        }
        auto c = weak_control.lock();
        return c && c->send(request);
    });

    Future<T> result = op->future();
    op->start();
    return Transfer<T>(std::move(result), monitor);
}

} // namespace tether

#endif // TETHER_TRANSFER_HPP
