/**
 * @file error.hpp
 * @brief Error taxonomy and exception class for Tether C++ bindings
 */

#ifndef TETHER_ERROR_HPP
#define TETHER_ERROR_HPP

#include <tether.h>

#include <exception>
#include <string>
#include <string_view>

namespace tether {

/**
 * Outcome kind of a bridged native operation
 */
enum class ErrorKind {
    Success,       ///< Completed without error
    Canceled,      ///< Ended because cancellation was requested
    DomainError,   ///< Native runtime reported a domain-specific error code
    UnknownFailure ///< Bridging layer could not classify the completion
};

/// Return a short name for the given kind ("Success", "Canceled", etc.)
[[nodiscard]] inline const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Success:
        return "Success";
    case ErrorKind::Canceled:
        return "Canceled";
    case ErrorKind::DomainError:
        return "DomainError";
    case ErrorKind::UnknownFailure:
        return "UnknownFailure";
    default:
        return "???";
    }
}

/**
 * Exception class for Tether errors
 *
 * Carries the outcome kind, the native error code (verbatim for domain
 * errors) and the native error message.
 */
class Error : public std::exception {
  public:
    /**
     * Construct error
     *
     * @param kind    Outcome kind
     * @param code    Native error code (0 when not applicable)
     * @param message Native or bridge-provided description
     */
    Error(ErrorKind kind, int code, std::string_view message)
        : kind_(kind), code_(code), message_(message) {
        what_ = error_kind_name(kind);
        if (kind == ErrorKind::DomainError) {
            what_ += "(" + std::to_string(code) + ")";
        }
        if (!message_.empty()) {
            what_ += ": " + message_;
        }
    }

    /// Operation ended because cancellation was requested
    [[nodiscard]] static Error canceled(std::string_view message = "operation canceled") {
        return Error(ErrorKind::Canceled, TETHER_ERROR_CANCELLED, message);
    }

    /// Native runtime reported a domain error
    [[nodiscard]] static Error domain(int code, std::string_view message) {
        return Error(ErrorKind::DomainError, code, message);
    }

    /// Bridging layer failure (invariant violation, unclassifiable completion)
    [[nodiscard]] static Error unknown(std::string_view message) {
        return Error(ErrorKind::UnknownFailure, 0, message);
    }

    /**
     * Get the outcome kind
     */
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /**
     * Get the native error code
     * @return Code exactly as reported by the runtime
     */
    [[nodiscard]] int code() const noexcept { return code_; }

    /**
     * Get the native error message (without kind prefix)
     */
    [[nodiscard]] const std::string &message() const noexcept { return message_; }

    /**
     * Get human-readable description
     * @return "<Kind>[(code)]: message"
     */
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

    // Convenience predicates
    [[nodiscard]] bool is_canceled() const noexcept { return kind_ == ErrorKind::Canceled; }
    [[nodiscard]] bool is_domain() const noexcept { return kind_ == ErrorKind::DomainError; }
    [[nodiscard]] bool is_unknown() const noexcept { return kind_ == ErrorKind::UnknownFailure; }

  private:
    ErrorKind kind_;
    int code_;
    std::string message_;
    std::string what_;
};

} // namespace tether

#endif // TETHER_ERROR_HPP
