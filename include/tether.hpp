/**
 * @file tether.hpp
 * @brief Main header for Tether C++ bindings
 *
 * This is the single header you need to include to bridge native runtime
 * operations into C++.  It provides RAII handle ownership, exceptions,
 * futures and coroutine support.
 *
 * Example (continuation-based):
 * @code
 * #include <tether.hpp>
 *
 * tether::NativeFuture native(&storage_ops, storage_get_bytes(path));
 * auto bytes = tether::bridge<std::vector<char>>(std::move(native), read_payload);
 * bytes.then([](const tether::Future<std::vector<char>> &f) {
 *     if (f.state() == tether::ResultState::Succeeded) {
 *         std::cout << "Got " << f.value().size() << " bytes\n";
 *     }
 * });
 * @endcode
 *
 * Example (coroutine-based):
 * @code
 * #include <tether.hpp>
 *
 * tether::Task<size_t> fetch_size(Storage &storage) {
 *     auto bytes = co_await storage.get_bytes("a/b");
 *     co_return bytes.size();
 * }
 * @endcode
 */

#ifndef TETHER_HPP
#define TETHER_HPP

// C API
#include <tether.h>

// C++ bindings (order matters for dependencies)
#include <tether/fwd.hpp>
#include <tether/error.hpp>
#include <tether/log.hpp>
#include <tether/options.hpp>
#include <tether/stats.hpp>
#include <tether/classify.hpp>
#include <tether/handle.hpp>
#include <tether/cancel.hpp>
#include <tether/future.hpp>
#include <tether/detail/callback_registry.hpp>
#include <tether/bridge.hpp>
#include <tether/transfer.hpp>
#include <tether/completion_status.hpp>
#include <tether/coro.hpp>
#include <tether/loopback.hpp>

#endif // TETHER_HPP
