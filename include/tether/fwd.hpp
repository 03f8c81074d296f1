/**
 * @file fwd.hpp
 * @brief Forward declarations for Tether C++ bindings
 */

#ifndef TETHER_FWD_HPP
#define TETHER_FWD_HPP

namespace tether {

class Error;
class Options;
class RegistryStats;
class NativeFuture;
class NativeController;
class CancelSource;
class CancelToken;
class TransferMonitor;
class TransferStateUpdater;
class ProgressObserver;
class CompletionStatus;
class LoopbackRuntime;

struct Classification;
struct TransferProgress;

template <typename T> class Future;
template <typename T> class Promise;
template <typename T> class CompletionBridge;
template <typename T> class Transfer;

template <typename T = void> class Task;

} // namespace tether

#endif // TETHER_FWD_HPP
