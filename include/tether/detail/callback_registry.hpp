/**
 * @file callback_registry.hpp
 * @brief Token-indexed completion closures for Tether C++ bindings
 *
 * This is an internal header - not part of the public API.
 */

#ifndef TETHER_DETAIL_CALLBACK_REGISTRY_HPP
#define TETHER_DETAIL_CALLBACK_REGISTRY_HPP

#include <tether.h>
#include <tether/log.hpp>
#include <tether/stats.hpp>

#include <climits>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tether::detail {

/**
 * Table mapping small integer tokens to pending completion closures
 *
 * The native completion mechanism can only carry an int back across the
 * boundary, so each closure is parked here under a token and recovered
 * when the runtime calls tether_detail_completion_trampoline(token).
 *
 * Tokens are positive and unique among pending registrations.  The key
 * space wraps at max_token; keys still pending are skipped so a reused key
 * never collides with a live one.
 *
 * Thread-safe.  A single mutex guards the map; it is never held while a
 * closure runs, so closures may register new tokens.
 */
class CallbackRegistry {
  public:
    using Closure = std::function<void()>;

    explicit CallbackRegistry(int max_token = INT_MAX) : max_token_(max_token) {
        if (max_token < 1) {
            throw std::invalid_argument("max_token must be positive");
        }
    }

    CallbackRegistry(const CallbackRegistry &) = delete;
    CallbackRegistry &operator=(const CallbackRegistry &) = delete;

    /**
     * Process-wide registry used by the completion trampoline
     *
     * Created on first use and intentionally never destroyed: native
     * runtimes may deliver late callbacks during static destruction.
     */
    static CallbackRegistry &instance() {
        static CallbackRegistry *registry = new CallbackRegistry();
        return *registry;
    }

    /**
     * Park a closure and return its token
     * @throws std::length_error if every token in the key space is pending
     */
    [[nodiscard]] int add(Closure closure) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closures_.size() >= static_cast<size_t>(max_token_)) {
            throw std::length_error("callback registry exhausted");
        }
        do {
            last_token_ = (last_token_ >= max_token_) ? 1 : last_token_ + 1;
        } while (closures_.count(last_token_) != 0);

        closures_.emplace(last_token_, std::move(closure));
        ++registered_;
        return last_token_;
    }

    /**
     * Invoke and remove the closure registered under token
     *
     * Unknown or already-consumed tokens are ignored: they come from
     * duplicate native callbacks or deliveries after disposal.
     *
     * @return True if a closure was found and invoked
     */
    bool deliver(int token) {
        Closure closure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = closures_.find(token);
            if (it == closures_.end()) {
                ++ignored_;
                return false;
            }
            closure = std::move(it->second);
            closures_.erase(it);
            ++delivered_;
        }
        if (closure) {
            closure();
        }
        return true;
    }

    /**
     * Remove a registration without invoking it
     * @return True if the token was still pending
     */
    bool remove(int token) {
        Closure closure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = closures_.find(token);
            if (it == closures_.end()) {
                return false;
            }
            closure = std::move(it->second);
            closures_.erase(it);
            ++removed_;
        }
        // closure destroyed here, outside the lock
        return true;
    }

    /**
     * Check whether a token is still waiting for delivery
     */
    [[nodiscard]] bool contains(int token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closures_.count(token) != 0;
    }

    /**
     * Get number of pending registrations
     */
    [[nodiscard]] size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closures_.size();
    }

    /**
     * Get registry statistics snapshot
     */
    [[nodiscard]] RegistryStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        RegistryStats s;
        s.pending_ = closures_.size();
        s.registered_ = registered_;
        s.delivered_ = delivered_;
        s.ignored_ = ignored_;
        s.removed_ = removed_;
        return s;
    }

  private:
    mutable std::mutex mutex_;
    std::unordered_map<int, Closure> closures_;
    const int max_token_;
    int last_token_ = 0;
    uint64_t registered_ = 0;
    uint64_t delivered_ = 0;
    uint64_t ignored_ = 0;
    uint64_t removed_ = 0;
};

} // namespace tether::detail

/**
 * C completion trampoline
 *
 * extern "C" linkage is required because this function pointer is passed
 * to the native runtime. Using C++ linkage as a C function pointer is
 * technically UB.
 */
extern "C" inline void tether_detail_completion_trampoline(int token) {
    try {
        tether::detail::CallbackRegistry::instance().deliver(token);
    } catch (const std::exception &e) {
        tether::log_emit(tether::LogLevel::Error,
                         std::string("completion for token ") + std::to_string(token) +
                             " threw: " + e.what());
        // Exceptions cannot propagate through extern "C" (UB)
        std::terminate();
    } catch (...) {
        std::terminate();
    }
}

#endif // TETHER_DETAIL_CALLBACK_REGISTRY_HPP
