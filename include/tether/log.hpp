/**
 * @file log.hpp
 * @brief Process-wide log sink for tether
 *
 * The library is silent until a handler is installed.  Messages from the
 * compiled core (src/log.c), from the header-only bridge code and from the
 * application all reach the same handler through the C dispatch in
 * tether_log_emit(), on whichever thread produced them.
 *
 * @code
 *   tether::set_log_handler([](tether::LogLevel level, std::string_view msg) {
 *       std::cerr << tether::log_level_name(level) << ": " << msg << "\n";
 *   });
 *   tether::log_emit(tether::LogLevel::Notice, "PutFile", "retrying upload");
 *   // -> "NOTICE: PutFile: retrying upload"
 * @endcode
 */

#ifndef TETHER_LOG_HPP
#define TETHER_LOG_HPP

#include <tether.h>

#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace tether {

/// Severity, numerically equal to the TETHER_LOG_* (syslog) priorities
enum class LogLevel {
    Error = TETHER_LOG_ERR,
    Warning = TETHER_LOG_WARN,
    Notice = TETHER_LOG_NOTICE,
    Info = TETHER_LOG_INFO,
    Debug = TETHER_LOG_DEBUG
};

/// Short tag for a level: "ERR", "WARN", "NOTICE", "INFO" or "DEBUG"
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    }
    return "?";
}

using LogHandler = std::function<void(LogLevel, std::string_view)>;

namespace detail {

struct LogSink {
    std::mutex mutex;
    LogHandler handler;
};

/// One sink per process; inline variables are merged across TUs
inline LogSink log_sink;

} // namespace detail

} // namespace tether

/// Handed to tether_set_log_handler(); forwards C messages to the C++ handler
extern "C" inline void tether_detail_log_trampoline(int level, const char *msg,
                                                    void * /*userdata*/) {
    if (msg == nullptr) {
        return;
    }
    auto &sink = tether::detail::log_sink;
    try {
        std::lock_guard<std::mutex> lock(sink.mutex);
        if (sink.handler) {
            sink.handler(static_cast<tether::LogLevel>(level), msg);
        }
    } catch (...) {
        // A throwing handler cannot unwind into C callers
        std::terminate();
    }
}

namespace tether {

/**
 * Install the process-wide log handler, replacing any previous one
 *
 * Invoked on native runtime threads as well as caller threads; it must be
 * thread-safe and must not throw.
 */
inline void set_log_handler(LogHandler handler) {
    {
        std::lock_guard<std::mutex> lock(detail::log_sink.mutex);
        detail::log_sink.handler = std::move(handler);
    }
    tether_set_log_handler(tether_detail_log_trampoline, nullptr);
}

/// Uninstall the handler; the library is silent again
inline void clear_log_handler() noexcept {
    tether_set_log_handler(nullptr, nullptr);
    std::lock_guard<std::mutex> lock(detail::log_sink.mutex);
    detail::log_sink.handler = nullptr;
}

/// Send a message to the installed handler; no-op without one
inline void log_emit(LogLevel level, std::string_view msg) {
    std::string line(msg);
    tether_log_emit(static_cast<int>(level), "%s", line.c_str());
}

/// Send "<operation>: <msg>" to the installed handler
inline void log_emit(LogLevel level, std::string_view operation, std::string_view msg) {
    std::string line;
    line.reserve(operation.size() + msg.size() + 2);
    line.append(operation).append(": ").append(msg);
    tether_log_emit(static_cast<int>(level), "%s", line.c_str());
}

} // namespace tether

#endif // TETHER_LOG_HPP
