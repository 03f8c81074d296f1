/**
 * @file stats.hpp
 * @brief Callback registry statistics for Tether C++ bindings
 */

#ifndef TETHER_STATS_HPP
#define TETHER_STATS_HPP

#include <cstddef>
#include <cstdint>

namespace tether {

namespace detail {
class CallbackRegistry;
}

/**
 * Callback registry statistics snapshot
 *
 * Provides read-only access to registry counters.  All counters are
 * cumulative since the registry was created.
 */
class RegistryStats {
  public:
    /**
     * Get number of registrations still waiting for delivery
     */
    [[nodiscard]] size_t pending() const noexcept { return pending_; }

    /**
     * Get total registrations made
     */
    [[nodiscard]] uint64_t registered() const noexcept { return registered_; }

    /**
     * Get deliveries that found and invoked a closure
     */
    [[nodiscard]] uint64_t delivered() const noexcept { return delivered_; }

    /**
     * Get deliveries for unknown or already-consumed tokens
     *
     * Non-zero values indicate duplicate or late native callbacks.
     */
    [[nodiscard]] uint64_t ignored() const noexcept { return ignored_; }

    /**
     * Get registrations removed without being invoked
     */
    [[nodiscard]] uint64_t removed() const noexcept { return removed_; }

  private:
    friend class detail::CallbackRegistry;

    size_t pending_ = 0;
    uint64_t registered_ = 0;
    uint64_t delivered_ = 0;
    uint64_t ignored_ = 0;
    uint64_t removed_ = 0;
};

} // namespace tether

#endif // TETHER_STATS_HPP
