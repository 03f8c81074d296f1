/**
 * @file cancel_request.cpp
 * @brief Demonstrate cancelling a bridged operation
 *
 * Starts a long-running native operation that polls its cancel flag, then
 * requests cancellation through a CancelSource.  The Future settles as
 * Canceled once the native runtime reports completion.
 *
 * Run:   ./examples/cpp/cancel_request
 */

#include <tether.hpp>

#include <chrono>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

int main() {
    std::cout << "Tether Cancellation Example\n";
    std::cout << "===========================\n\n";

    try {
        tether::LoopbackRuntime runtime;
        tether::CancelSource source;

        auto native = runtime.start([](tether::LoopbackRuntime::Context &ctx) {
            // Simulate a slow operation (e.g. a large download)
            for (int i = 0; i < 5000; i++) {
                if (ctx.canceled()) {
                    return TETHER_ERROR_CANCELLED;
                }
                std::this_thread::sleep_for(1ms);
            }
            ctx.set_result(42);
            return TETHER_ERROR_NONE;
        });

        auto result = tether::bridge<int>(std::move(native),
                                          tether::LoopbackRuntime::extractor<int>(),
                                          source.token(), tether::Options().name("SlowFetch"));

        std::this_thread::sleep_for(20ms);
        std::cout << "State before cancel: " << tether::result_state_name(result.state()) << "\n";

        std::cout << "Requesting cancel...\n";
        source.request_cancel();

        result.wait();
        std::cout << "State after cancel:  " << tether::result_state_name(result.state()) << "\n";

        if (result.state() == tether::ResultState::Canceled) {
            std::cout << "Cancel reported: " << result.error().what() << "\n";
        }

        // Requesting again is harmless
        if (!source.request_cancel()) {
            std::cout << "Second cancel request ignored\n";
        }

        runtime.drain();
        return 0;

    } catch (const tether::Error &e) {
        std::cerr << "Tether error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
