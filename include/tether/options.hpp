/**
 * @file options.hpp
 * @brief Options builder class for Tether C++ bindings
 */

#ifndef TETHER_OPTIONS_HPP
#define TETHER_OPTIONS_HPP

#include <tether.h>

#include <string>
#include <string_view>

namespace tether {

/**
 * Per-operation bridge configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * tether::Options opts;
 * opts.name("PutBytes")
 *     .log_outcomes(true);
 *
 * auto result = tether::bridge<Metadata>(std::move(future), extract, {}, opts);
 * @endcode
 */
class Options {
  public:
    /**
     * Initialize with default options
     */
    Options() noexcept { tether_options_init(&opts_); }

    /**
     * Set the operation name used in log messages
     * @param name Short description, e.g. "GetBytes"
     * @return Reference to this for chaining
     */
    Options &name(std::string_view name) {
        name_ = name;
        return *this;
    }

    /**
     * Set the error code the runtime uses to report cancellation
     * @param code Sentinel (default: TETHER_ERROR_CANCELLED)
     * @return Reference to this for chaining
     */
    Options &canceled_code(int code) noexcept {
        opts_.canceled_code = code;
        return *this;
    }

    /**
     * Log every outcome ("<name> completed successfully." etc.) at debug level
     * @param enable True to enable
     * @return Reference to this for chaining
     * @note Unknown failures are always logged at error level
     */
    Options &log_outcomes(bool enable) noexcept {
        opts_.log_outcomes = enable;
        return *this;
    }

    /**
     * Get the operation name ("operation" when unset)
     */
    [[nodiscard]] const std::string &name() const noexcept { return name_; }

    /**
     * Get underlying C options struct
     * @return Reference to tether_options_t
     */
    [[nodiscard]] const tether_options_t &c_options() const noexcept { return opts_; }

  private:
    tether_options_t opts_;
    std::string name_ = "operation";
};

} // namespace tether

#endif // TETHER_OPTIONS_HPP
