/**
 * @file loopback.cpp
 * @brief Worker-thread implementation of the tether.h runtime contract
 */

#include <tether/loopback.hpp>

#include "log.h"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace tether {

namespace detail {

/**
 * State shared by the worker and the handles it hands out
 *
 * mutex guards everything except progress_mutex, which is held for the
 * whole duration of a progress callback so controller release can wait for
 * an in-flight call to return.
 */
struct LoopbackOp {
    std::mutex mutex;
    std::condition_variable cv;

    tether_status_t status = TETHER_STATUS_PENDING;
    int error = TETHER_ERROR_NONE;
    std::string message;
    std::any result;

    tether_completion_fn completion_fn = nullptr;
    int token = 0;

    std::atomic<bool> cancel_requested{false};
    bool paused = false;

    bool has_controller = false;
    bool controller_ready = false; // callback installed or controller released
    std::mutex progress_mutex;
    tether_progress_fn progress_fn = nullptr;
    void *progress_user_data = nullptr;

    std::atomic<size_t> *live_handles = nullptr;
};

/// What a tether_future_t* / tether_controller_t* actually points to
struct LoopbackHandle {
    std::shared_ptr<LoopbackOp> op;
};

} // namespace detail

namespace {

using detail::LoopbackHandle;
using detail::LoopbackOp;

LoopbackOp &op_of(const tether_future_t *future) {
    return *reinterpret_cast<const LoopbackHandle *>(future)->op;
}

LoopbackOp &op_of(const tether_controller_t *controller) {
    return *reinterpret_cast<const LoopbackHandle *>(controller)->op;
}

void request_cancel(LoopbackOp &op) {
    std::lock_guard<std::mutex> lock(op.mutex);
    op.cancel_requested.store(true, std::memory_order_release);
    op.cv.notify_all();
}

void release_handle(LoopbackHandle *raw) {
    std::unique_ptr<LoopbackHandle> handle(raw);
    handle->op->live_handles->fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace

extern "C" {

static tether_status_t loopback_status(const tether_future_t *future) {
    LoopbackOp &op = op_of(future);
    std::lock_guard<std::mutex> lock(op.mutex);
    return op.status;
}

static int loopback_error(const tether_future_t *future) {
    LoopbackOp &op = op_of(future);
    std::lock_guard<std::mutex> lock(op.mutex);
    return op.error;
}

// The message is only written before status turns COMPLETE.
static const char *loopback_error_message(const tether_future_t *future) {
    LoopbackOp &op = op_of(future);
    std::lock_guard<std::mutex> lock(op.mutex);
    return op.status == TETHER_STATUS_COMPLETE ? op.message.c_str() : "";
}

static const void *loopback_result(const tether_future_t *future) {
    LoopbackOp &op = op_of(future);
    std::lock_guard<std::mutex> lock(op.mutex);
    if (op.status != TETHER_STATUS_COMPLETE || !op.result.has_value()) {
        return nullptr;
    }
    return &op.result;
}

static int loopback_on_completion(tether_future_t *future, tether_completion_fn fn, int token) {
    LoopbackOp &op = op_of(future);
    {
        std::lock_guard<std::mutex> lock(op.mutex);
        if (!fn || op.completion_fn) {
            return -1;
        }
        if (op.status != TETHER_STATUS_COMPLETE) {
            op.completion_fn = fn;
            op.token = token;
            return 0;
        }
    }
    // Already complete: deliver on the registering thread
    fn(token);
    return 0;
}

static int loopback_cancel(tether_future_t *future) {
    request_cancel(op_of(future));
    return 0;
}

static void loopback_release(tether_future_t *future) {
    release_handle(reinterpret_cast<LoopbackHandle *>(future));
}

static int loopback_set_progress_callback(tether_controller_t *controller, tether_progress_fn fn,
                                          void *user_data) {
    LoopbackOp &op = op_of(controller);
    {
        std::lock_guard<std::mutex> progress(op.progress_mutex);
        op.progress_fn = fn;
        op.progress_user_data = user_data;
    }
    std::lock_guard<std::mutex> lock(op.mutex);
    op.controller_ready = true;
    op.cv.notify_all();
    return 0;
}

static int loopback_controller_cancel(tether_controller_t *controller) {
    request_cancel(op_of(controller));
    return 0;
}

static int loopback_pause(tether_controller_t *controller) {
    LoopbackOp &op = op_of(controller);
    std::lock_guard<std::mutex> lock(op.mutex);
    if (op.status == TETHER_STATUS_COMPLETE) {
        return -1;
    }
    op.paused = true;
    return 0;
}

static int loopback_resume(tether_controller_t *controller) {
    LoopbackOp &op = op_of(controller);
    std::lock_guard<std::mutex> lock(op.mutex);
    if (op.status == TETHER_STATUS_COMPLETE) {
        return -1;
    }
    op.paused = false;
    op.cv.notify_all();
    return 0;
}

static void loopback_controller_release(tether_controller_t *controller) {
    LoopbackOp &op = op_of(controller);
    {
        // Waits for an in-flight progress call to return
        std::lock_guard<std::mutex> progress(op.progress_mutex);
        op.progress_fn = nullptr;
        op.progress_user_data = nullptr;
    }
    {
        std::lock_guard<std::mutex> lock(op.mutex);
        op.controller_ready = true;
        op.paused = false;
        op.cv.notify_all();
    }
    release_handle(reinterpret_cast<LoopbackHandle *>(controller));
}

} // extern "C"

namespace {

const tether_future_ops_t k_future_ops = {
    loopback_status, loopback_error,  loopback_error_message, loopback_result,
    loopback_on_completion, loopback_cancel, loopback_release,
};

const tether_controller_ops_t k_controller_ops = {
    loopback_set_progress_callback, loopback_controller_cancel, loopback_pause,
    loopback_resume,                loopback_controller_release,
};

} // namespace

// ----------------------------------------------------------------------------
// Context
// ----------------------------------------------------------------------------

bool LoopbackRuntime::Context::canceled() const noexcept {
    return op_->cancel_requested.load(std::memory_order_acquire);
}

void LoopbackRuntime::Context::report_progress(long long bytes, long long total) {
    {
        std::unique_lock<std::mutex> lock(op_->mutex);
        op_->cv.wait(lock, [this] {
            return !op_->paused || op_->cancel_requested.load(std::memory_order_acquire);
        });
    }
    std::lock_guard<std::mutex> progress(op_->progress_mutex);
    if (op_->progress_fn) {
        op_->progress_fn(bytes, total, op_->progress_user_data);
    }
}

void LoopbackRuntime::Context::set_result(std::any value) {
    std::lock_guard<std::mutex> lock(op_->mutex);
    op_->result = std::move(value);
}

void LoopbackRuntime::Context::set_error_message(std::string message) {
    std::lock_guard<std::mutex> lock(op_->mutex);
    op_->message = std::move(message);
}

// ----------------------------------------------------------------------------
// LoopbackRuntime
// ----------------------------------------------------------------------------

LoopbackRuntime::LoopbackRuntime() = default;

LoopbackRuntime::~LoopbackRuntime() { drain(); }

void LoopbackRuntime::drain() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto &w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

size_t LoopbackRuntime::tracked_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void LoopbackRuntime::reap_finished() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

const tether_future_ops_t &LoopbackRuntime::future_ops() noexcept { return k_future_ops; }

const tether_controller_ops_t &LoopbackRuntime::controller_ops() noexcept {
    return k_controller_ops;
}

NativeFuture LoopbackRuntime::start(Work work) {
    auto op = launch(std::move(work), false);
    auto handle = std::make_unique<LoopbackHandle>(LoopbackHandle{op});
    live_handles_.fetch_add(1, std::memory_order_acq_rel);
    return NativeFuture(&k_future_ops, reinterpret_cast<tether_future_t *>(handle.release()));
}

std::pair<NativeFuture, NativeController> LoopbackRuntime::start_transfer(Work work) {
    auto op = launch(std::move(work), true);
    auto future = std::make_unique<LoopbackHandle>(LoopbackHandle{op});
    auto controller = std::make_unique<LoopbackHandle>(LoopbackHandle{op});
    live_handles_.fetch_add(2, std::memory_order_acq_rel);
    NativeFuture native(&k_future_ops, reinterpret_cast<tether_future_t *>(future.release()));
    NativeController control(&k_controller_ops,
                             reinterpret_cast<tether_controller_t *>(controller.release()));
    return {std::move(native), std::move(control)};
}

std::shared_ptr<detail::LoopbackOp> LoopbackRuntime::launch(Work work, bool with_controller) {
    auto op = std::make_shared<LoopbackOp>();
    op->has_controller = with_controller;
    op->live_handles = &live_handles_;

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([op, done, work = std::move(work)]() {
        if (op->has_controller) {
            std::unique_lock<std::mutex> lock(op->mutex);
            op->cv.wait(lock, [&op] { return op->controller_ready; });
        }

        Context ctx(op);
        int rc = TETHER_ERROR_NONE;
        std::string failure;
        try {
            rc = work ? work(ctx) : TETHER_ERROR_NONE;
        } catch (const std::exception &e) {
            rc = -1;
            failure = e.what();
            tether_log(TETHER_LOG_WARN, "loopback: operation threw: %s", e.what());
        }

        tether_completion_fn fn = nullptr;
        int token = 0;
        {
            std::lock_guard<std::mutex> lock(op->mutex);
            op->error = rc;
            if (!failure.empty()) {
                op->message = std::move(failure);
            } else if (rc == TETHER_ERROR_CANCELLED && op->message.empty()) {
                op->message = "operation cancelled";
            }
            op->status = TETHER_STATUS_COMPLETE;
            op->paused = false;
            fn = op->completion_fn;
            token = op->token;
        }
        if (fn) {
            fn(token);
        }
        done->store(true, std::memory_order_release);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished();
    workers_.push_back(Worker{std::move(worker), std::move(done)});
    return op;
}

} // namespace tether
