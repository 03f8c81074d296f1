/**
 * @file completion_status.hpp
 * @brief Uniform outcome inspection for resolved futures
 *
 * Operations that chain several native calls (upload then fetch metadata,
 * delete then refresh) only need to know whether a step succeeded, was
 * canceled or failed.  CompletionStatus extracts that from any Future<T>
 * and logs it once under the operation's name.
 */

#ifndef TETHER_COMPLETION_STATUS_HPP
#define TETHER_COMPLETION_STATUS_HPP

#include <tether/classify.hpp>
#include <tether/error.hpp>
#include <tether/future.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether {

class CompletionStatus {
  public:
    /**
     * Inspect a resolved future
     *
     * @param future    Future in a terminal state
     * @param operation Name used in the log line
     * @throws std::logic_error if the future is still pending
     */
    template <typename T>
    CompletionStatus(const Future<T> &future, std::string_view operation)
        : operation_(operation) {
        switch (future.state()) {
        case ResultState::Succeeded:
            break;
        case ResultState::Canceled:
        case ResultState::Failed:
            error_.emplace(future.error());
            break;
        case ResultState::Pending:
        default:
            throw std::logic_error("CompletionStatus requires a resolved future");
        }
        detail::log_outcome(operation_, outcome(), true);
    }

    [[nodiscard]] bool successful() const noexcept { return !error_; }

    [[nodiscard]] bool canceled() const noexcept { return error_ && error_->is_canceled(); }

    [[nodiscard]] bool failed() const noexcept { return error_ && !error_->is_canceled(); }

    /**
     * Error of a canceled or failed operation
     * @return Pointer valid for the lifetime of this object, nullptr on success
     */
    [[nodiscard]] const Error *error() const noexcept { return error_ ? &*error_ : nullptr; }

    [[nodiscard]] const std::string &operation() const noexcept { return operation_; }

    /**
     * Rebuild a Future<bool> carrying the same outcome
     *
     * Succeeded(true) on success; the original error otherwise.
     */
    [[nodiscard]] Future<bool> to_future() const {
        if (error_) {
            return make_failed_future<bool>(*error_);
        }
        return make_ready_future(true);
    }

  private:
    [[nodiscard]] Classification outcome() const {
        if (!error_) {
            return {ErrorKind::Success, 0, {}};
        }
        return {error_->kind(), error_->code(), error_->message()};
    }

    std::string operation_;
    std::optional<Error> error_;
};

} // namespace tether

#endif // TETHER_COMPLETION_STATUS_HPP
