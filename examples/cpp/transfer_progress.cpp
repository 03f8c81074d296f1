/**
 * @file transfer_progress.cpp
 * @brief Observe progress of a long-running transfer with pause and resume
 *
 * The native side reports byte counts from its worker thread; the observer
 * prints each snapshot.  The main thread pauses the transfer halfway and
 * resumes it a moment later.
 *
 * Run:   ./examples/cpp/transfer_progress
 */

#include <tether.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

constexpr long long TOTAL_BYTES = 8 * 1024 * 1024; // 8 MB
constexpr long long CHUNK = 512 * 1024;

int main() {
    try {
        tether::LoopbackRuntime runtime;

        auto [native, controller] =
            runtime.start_transfer([](tether::LoopbackRuntime::Context &ctx) {
                for (long long sent = CHUNK; sent <= TOTAL_BYTES; sent += CHUNK) {
                    std::this_thread::sleep_for(10ms);
                    ctx.report_progress(sent, TOTAL_BYTES);
                    if (ctx.canceled()) {
                        return TETHER_ERROR_CANCELLED;
                    }
                }
                ctx.set_result(std::string("md5:5d41402abc4b2a76b9719d911017c592"));
                return TETHER_ERROR_NONE;
            });

        auto observer = tether::make_observer([](const tether::TransferProgress &p) {
            double pct = p.total_known() ? 100.0 * p.bytes_transferred / p.total_bytes : 0.0;
            std::cout << "\r" << std::setw(11) << tether::transfer_state_name(p.state) << " "
                      << std::fixed << std::setprecision(1) << std::setw(5) << pct << "%"
                      << std::flush;
        });

        auto upload = tether::bridge_transfer<std::string>(
            std::move(native), std::move(controller),
            tether::LoopbackRuntime::extractor<std::string>(), observer, {},
            tether::Options().name("PutFile"), TOTAL_BYTES);

        while (upload.snapshot().bytes_transferred < TOTAL_BYTES / 2 && !upload.result().ready()) {
            std::this_thread::sleep_for(1ms);
        }

        if (upload.pause()) {
            std::cout << "\nPaused at " << upload.snapshot().bytes_transferred << " bytes\n";
            std::this_thread::sleep_for(100ms);
            upload.resume();
            std::cout << "Resumed\n";
        }

        std::string checksum = upload.result().get();
        auto final_state = upload.snapshot();
        std::cout << "\nTransfer " << tether::transfer_state_name(final_state.state) << ", "
                  << final_state.bytes_transferred << " bytes, checksum " << checksum << "\n";

        runtime.drain();
        return 0;

    } catch (const tether::Error &e) {
        std::cerr << "\nTether error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
