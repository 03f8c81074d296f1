/**
 * @file classify.hpp
 * @brief Mapping from native completion data to an outcome kind
 */

#ifndef TETHER_CLASSIFY_HPP
#define TETHER_CLASSIFY_HPP

#include <tether.h>
#include <tether/error.hpp>
#include <tether/log.hpp>

#include <string>
#include <string_view>

namespace tether {

/**
 * Result of classifying a native completion
 *
 * code and message are copied verbatim from the runtime so callers can
 * match on their own domain error taxonomy.
 */
struct Classification {
    ErrorKind kind = ErrorKind::UnknownFailure;
    int code = 0;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return kind == ErrorKind::Success; }

    /// Convert a non-success classification to an Error
    [[nodiscard]] Error to_error() const {
        if (kind == ErrorKind::Canceled) {
            return Error(ErrorKind::Canceled, code, message.empty() ? "operation canceled" : message);
        }
        return Error(kind, code, message);
    }
};

/**
 * Classify a native (error code, message) pair
 *
 * Cancellation wins over whatever the runtime reported: once the caller
 * asked to cancel, a racing success or domain error still classifies as
 * Canceled.
 *
 * @param error_code       Code from the runtime (0 = success)
 * @param message          Runtime error message
 * @param cancel_requested Caller signalled cancellation before delivery
 * @param canceled_code    Sentinel the runtime uses for cancellation
 */
[[nodiscard]] inline Classification classify(int error_code, std::string_view message,
                                             bool cancel_requested,
                                             int canceled_code = TETHER_ERROR_CANCELLED) {
    if (cancel_requested || error_code == canceled_code) {
        return {ErrorKind::Canceled, canceled_code, std::string(message)};
    }
    if (error_code == TETHER_ERROR_NONE) {
        return {ErrorKind::Success, TETHER_ERROR_NONE, {}};
    }
    return {ErrorKind::DomainError, error_code, std::string(message)};
}

/**
 * Classify a delivery including the handle status observed at delivery time
 *
 * - Invalid: the handle was released or moved before delivery -> Canceled
 * - Pending: delivery without a final status -> UnknownFailure
 * - Complete: classified by error code
 */
[[nodiscard]] inline Classification classify(tether_status_t status, int error_code,
                                             std::string_view message, bool cancel_requested,
                                             int canceled_code = TETHER_ERROR_CANCELLED) {
    switch (status) {
    case TETHER_STATUS_INVALID:
        return {ErrorKind::Canceled, canceled_code, "operation released before completion"};
    case TETHER_STATUS_COMPLETE:
        return classify(error_code, message, cancel_requested, canceled_code);
    case TETHER_STATUS_PENDING:
    default:
        if (cancel_requested) {
            return {ErrorKind::Canceled, canceled_code, {}};
        }
        return {ErrorKind::UnknownFailure, error_code,
                "completion delivered while operation still pending"};
    }
}

namespace detail {

/**
 * Log a classified outcome for operation op
 *
 * UnknownFailure always goes out at Error level; the other outcomes only
 * when verbose is set, at Debug level.
 */
inline void log_outcome(std::string_view op, const Classification &outcome, bool verbose) {
    std::string line(op);
    switch (outcome.kind) {
    case ErrorKind::Success:
        if (!verbose) return;
        line += " completed successfully.";
        break;
    case ErrorKind::Canceled:
        if (!verbose) return;
        line += " canceled.";
        break;
    case ErrorKind::DomainError:
        if (!verbose) return;
        line += " failed (" + std::to_string(outcome.code) + ") " + outcome.message + ".";
        break;
    case ErrorKind::UnknownFailure:
    default:
        line += " failed unexpectedly: " + outcome.message;
        log_emit(LogLevel::Error, line);
        return;
    }
    log_emit(LogLevel::Debug, line);
}

} // namespace detail

} // namespace tether

#endif // TETHER_CLASSIFY_HPP
