#pragma once

// Dojo logging subsystem
// Wraps Quill v11.x async logging.
//
// Usage:
//   #include "dojo/core/Log.hh"
//   DOJO_LOG_INFO("Encounter: {} -> {}", from, to);
//   DOJO_LOG_DEBUG("{} struck {} for {}", attacker, defender, damage);

// <X11/X.h> is pulled in transitively by SDL on some Linux setups and defines
// bare-word macros that collide with Quill enum members.
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace dojo::log {

/// Initialize the logging subsystem (console + logs/ directory).
/// Call once at startup before any logging.
void init();

/// Initialize with an extra caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Valid after init().
quill::Logger* logger();

/// Session logger: startup, shutdown, session outcome.
quill::Logger* sessionLogger();

/// Set runtime log level of the root logger (within compile-time ceiling).
void setLevel(quill::LogLevel level);

} // namespace dojo::log

// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define DOJO_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(dojo::log::logger(), fmt, ##__VA_ARGS__)
#define DOJO_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(dojo::log::logger(), fmt, ##__VA_ARGS__)
#define DOJO_LOG_INFO(fmt, ...) QUILL_LOG_INFO(dojo::log::logger(), fmt, ##__VA_ARGS__)
#define DOJO_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(dojo::log::logger(), fmt, ##__VA_ARGS__)
#define DOJO_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(dojo::log::logger(), fmt, ##__VA_ARGS__)
#define DOJO_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(dojo::log::logger(), fmt, ##__VA_ARGS__)

#define DOJO_LOG_SESSION(fmt, ...) QUILL_LOG_INFO(dojo::log::sessionLogger(), fmt, ##__VA_ARGS__)
