/**
 * @file quickstart.cpp
 * @brief Minimal working example of bridging a native operation to a Future
 *
 * Run:   ./examples/cpp/quickstart
 */

#include <tether.hpp>

#include <iostream>
#include <string>

int main() {
    try {
        // Native runtime that runs each operation on its own worker thread
        tether::LoopbackRuntime runtime;

        // Start a native operation; the handle is owned by the bridge from here on
        tether::NativeFuture native = runtime.start([](tether::LoopbackRuntime::Context &ctx) {
            ctx.set_result(std::string("Hello from the native side!"));
            return TETHER_ERROR_NONE;
        });

        // Bridge it: the Future resolves when the native runtime reports completion
        tether::Future<std::string> greeting = tether::bridge<std::string>(
            std::move(native), tether::LoopbackRuntime::extractor<std::string>());

        // Block until resolved; get() throws tether::Error on failure or cancel
        std::cout << "Result: " << greeting.get() << "\n";

        runtime.drain();
        std::cout << "Live native handles: " << runtime.live_handles() << "\n";
        std::cout << "Success!\n";
        return 0;

    } catch (const tether::Error &e) {
        std::cerr << "Tether error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
