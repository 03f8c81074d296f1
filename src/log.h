/**
 * @file log.h
 * @brief Internal logging infrastructure
 *
 * Provides a user-settable log callback so the library never writes
 * directly to stderr.  Default handler is NULL (silent).
 *
 * Log level constants (TETHER_LOG_ERR, etc.) are defined in the
 * public header <tether.h>.
 */

#ifndef TETHER_LOG_H
#define TETHER_LOG_H

#include "../include/tether.h"
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Emit a log message through the registered handler (if any).
 *
 * No-op when no handler is registered.
 */
void tether_log(int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

/** va_list flavour of tether_log(). */
void tether_vlog(int level, const char *fmt, va_list ap);

#ifdef __cplusplus
}
#endif

#endif /* TETHER_LOG_H */
