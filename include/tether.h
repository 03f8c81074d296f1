/**
 * @file tether.h
 * @brief C ABI between Tether and a native operation runtime
 *
 * A native runtime (storage, network, query engine) runs long operations on
 * its own threads and hands out opaque handles.  This header describes the
 * contract such a runtime exposes so the C++ layer can turn each handle into
 * an awaitable result.
 *
 * Basic runtime side:
 * @code
 *   static const tether_future_ops_t my_ops = {
 *       my_status, my_error, my_error_message, my_result,
 *       my_on_completion, my_cancel, my_release,
 *   };
 *   // hand (&my_ops, future) to tether::NativeFuture
 * @endcode
 *
 * Completion is signalled by calling the registered tether_completion_fn with
 * the integer token it was registered with.  Only the token crosses the
 * boundary; closures stay on the C++ side.
 */

#ifndef TETHER_H
#define TETHER_H

#include <stdbool.h>
#include <stddef.h>

/* ============================================================================
 * Version Information
 * ============================================================================
 */

#define TETHER_VERSION_MAJOR 1
#define TETHER_VERSION_MINOR 0
#define TETHER_VERSION_PATCH 0

/** Version as a single integer: (major * 10000 + minor * 100 + patch) */
#define TETHER_VERSION \
  (TETHER_VERSION_MAJOR * 10000 + TETHER_VERSION_MINOR * 100 + TETHER_VERSION_PATCH)

/** Version as a string */
#define TETHER_VERSION_STRING "1.0.0"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================
 */

/**
 * Opaque native pending operation
 *
 * Owned by the native runtime.  The C++ side borrows it from the moment it is
 * handed over until it calls release() exactly once; after that the pointer
 * must never be passed back to the runtime.
 */
typedef struct tether_future tether_future_t;

/**
 * Opaque transfer controller (monitor/controller sub-handle)
 *
 * Accepts a progress callback and cancel/pause/resume requests for one
 * upload or download.
 */
typedef struct tether_controller tether_controller_t;

/**
 * Native operation status
 */
typedef enum {
  TETHER_STATUS_COMPLETE = 0, /**< Result (or error) is available */
  TETHER_STATUS_PENDING = 1,  /**< Operation still running */
  TETHER_STATUS_INVALID = 2,  /**< Never started, released or moved away */
} tether_status_t;

/** Error code reported by a successful operation */
#define TETHER_ERROR_NONE 0

/**
 * Error code a runtime reports when an operation ended because it was
 * cancelled.  Any other nonzero code is a domain error passed through
 * verbatim.
 */
#define TETHER_ERROR_CANCELLED (-125)

/**
 * Completion callback type
 *
 * Invoked by the runtime once the operation reaches a final status.
 *
 * @param token Integer registered with on_completion()
 *
 * RESTRICTIONS:
 * - May run on any runtime thread
 * - Must be invoked at most once per registration; duplicates are tolerated
 *   but ignored
 */
typedef void (*tether_completion_fn)(int token);

/**
 * Progress callback type
 *
 * @param bytes_transferred Bytes moved so far
 * @param total_bytes       Expected size, or -1 if unknown
 * @param user_data         Pointer passed to set_progress_callback()
 */
typedef void (*tether_progress_fn)(long long bytes_transferred, long long total_bytes,
                                   void *user_data);

/**
 * Function table describing how to drive a native future
 *
 * All entries are required except cancel, which may be NULL when the
 * operation cannot be interrupted.
 */
typedef struct {
  /** Current status.  Safe to call from any thread before release(). */
  tether_status_t (*status)(const tether_future_t *future);

  /** 0 on success, TETHER_ERROR_CANCELLED, or a domain error code. */
  int (*error)(const tether_future_t *future);

  /** Error description (may be NULL or empty).  Valid until release(). */
  const char *(*error_message)(const tether_future_t *future);

  /** Pointer to the result payload when complete without error. */
  const void *(*result)(const tether_future_t *future);

  /**
   * Arrange for fn(token) to be called when the operation completes.
   * If the operation is already complete the runtime may call fn before
   * returning.
   *
   * @return 0 on success, nonzero if the callback could not be registered
   */
  int (*on_completion)(tether_future_t *future, tether_completion_fn fn, int token);

  /**
   * Request cancellation (best-effort).  Completion is still delivered and
   * normally reports TETHER_ERROR_CANCELLED.
   *
   * @return 0 if the request was accepted
   */
  int (*cancel)(tether_future_t *future);

  /** Release the handle.  Called exactly once. */
  void (*release)(tether_future_t *future);
} tether_future_ops_t;

/**
 * Function table for a transfer controller
 *
 * pause and resume may be NULL when the runtime does not support them.
 *
 * After release() returns the runtime must not invoke the progress callback
 * again.
 */
typedef struct {
  /** @return 0 on success */
  int (*set_progress_callback)(tether_controller_t *controller, tether_progress_fn fn,
                               void *user_data);

  /** @return 0 if the request was accepted */
  int (*cancel)(tether_controller_t *controller);

  /** @return 0 if the request was accepted */
  int (*pause)(tether_controller_t *controller);

  /** @return 0 if the request was accepted */
  int (*resume)(tether_controller_t *controller);

  /** Release the controller.  Called exactly once. */
  void (*release)(tether_controller_t *controller);
} tether_controller_ops_t;

/**
 * Bridge configuration options
 *
 * Initialize with tether_options_init() before modifying.
 */
typedef struct {
  int canceled_code; /**< Error code treated as cancellation (default: TETHER_ERROR_CANCELLED) */
  bool log_outcomes; /**< Log every operation outcome at debug level (default: false) */
} tether_options_t;

/* ============================================================================
 * Configuration
 * ============================================================================
 */

/**
 * Initialize options with default values
 *
 * @param options Options structure to initialize
 */
void tether_options_init(tether_options_t *options);

/* ============================================================================
 * Logging
 * ============================================================================
 */

/** Log severity levels (match syslog priorities). */
#define TETHER_LOG_ERR 3    /**< Error (matches syslog LOG_ERR) */
#define TETHER_LOG_WARN 4   /**< Warning (matches syslog LOG_WARNING) */
#define TETHER_LOG_NOTICE 5 /**< Notice (matches syslog LOG_NOTICE) */
#define TETHER_LOG_INFO 6   /**< Informational (matches syslog LOG_INFO) */
#define TETHER_LOG_DEBUG 7  /**< Debug (matches syslog LOG_DEBUG) */

/**
 * Log callback type
 *
 * Called from whichever thread emits the message (including native
 * runtime threads).  Must be thread-safe.
 *
 * @param level    Severity (TETHER_LOG_ERR .. TETHER_LOG_DEBUG)
 * @param msg      NUL-terminated message
 * @param userdata Opaque pointer passed to tether_set_log_handler()
 */
typedef void (*tether_log_fn)(int level, const char *msg, void *userdata);

/**
 * Set the library-wide log handler
 *
 * The library is silent until a handler is installed.
 *
 * @param handler  Log callback (NULL to disable logging)
 * @param userdata Passed through to the handler
 */
void tether_set_log_handler(tether_log_fn handler, void *userdata);

/**
 * Emit a log message through the registered handler
 *
 * No-op when no handler is installed.  Messages longer than 1023 bytes are
 * truncated.
 */
void tether_log_emit(int level, const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

#ifdef __cplusplus
}
#endif

#endif /* TETHER_H */
