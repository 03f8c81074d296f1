/**
 * @file log_handler.cpp
 * @brief Demonstrate the tether custom log handler
 *
 * Shows how to install a custom log callback that formats library
 * messages with timestamps and severity levels, how outcome logging is
 * turned on per operation, and how to emit application-level messages
 * through the same pipeline using tether::log_emit().
 *
 * Run:   ./examples/cpp/log_handler
 */

#include <tether.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

int main() {
    std::cout << "Tether Log Handler Example\n";
    std::cout << "==========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    tether::set_log_handler([](tether::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << tether::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    tether::log_emit(tether::LogLevel::Info, "log handler installed, starting runtime");

    try {
        tether::LoopbackRuntime runtime;

        // --- Step 3: Bridge operations with outcome logging --------------
        auto opts = tether::Options().name("GetMetadata").log_outcomes(true);
        auto ok = tether::bridge<int>(runtime.start([](tether::LoopbackRuntime::Context &ctx) {
            ctx.set_result(128);
            return TETHER_ERROR_NONE;
        }),
                                      tether::LoopbackRuntime::extractor<int>(), {}, opts);

        auto missing = tether::bridge<int>(
            runtime.start([](tether::LoopbackRuntime::Context &ctx) {
                ctx.set_error_message("object does not exist at location");
                return 404;
            }),
            tether::LoopbackRuntime::extractor<int>(), {},
            tether::Options().name("GetMetadata").log_outcomes(true));

        ok.wait();
        missing.wait();

        // --- Step 4: Summarize a settled future --------------------------
        tether::CompletionStatus status(missing, "GetMetadata");
        if (status.failed()) {
            tether::log_emit(tether::LogLevel::Notice,
                             "lookup failed with code " + std::to_string(status.error()->code()));
        }

        runtime.drain();
    } catch (const tether::Error &e) {
        tether::log_emit(tether::LogLevel::Error, e.what());
        tether::clear_log_handler();
        return 1;
    }

    // --- Step 5: Clear handler ----------------------------------------------
    tether::log_emit(tether::LogLevel::Info, "done, clearing log handler");
    tether::clear_log_handler();

    std::cout << "\nDone.\n";
    return 0;
}
