#pragma once

// Chroma Logging Subsystem
// Wraps Quill v11.x async logging.
//
// Usage:
//   #include "chroma/core/Log.hh"
//   CHROMA_LOG_INFO("Palette built with {} colors", palette.size());

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <optional>
#include <string_view>

namespace chroma::log {

/// Initialize the logging subsystem (console output only).
/// Call once at startup before any logging.
void init();

/// Initialize with file sink in addition to console.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Falls back to init() (console only) on first use
/// when no init() call was made. Not thread-safe before initialization.
quill::Logger* logger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);

/// Map a config string ("trace", "debug", "info", "warning", "error",
/// "critical") to a Quill level. Case-sensitive.
std::optional<quill::LogLevel> parseLevel(std::string_view name);

} // namespace chroma::log

// Chroma logging macros - wrap Quill with the root logger.
#define CHROMA_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(chroma::log::logger(), fmt, ##__VA_ARGS__)
#define CHROMA_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(chroma::log::logger(), fmt, ##__VA_ARGS__)
#define CHROMA_LOG_INFO(fmt, ...) QUILL_LOG_INFO(chroma::log::logger(), fmt, ##__VA_ARGS__)
#define CHROMA_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(chroma::log::logger(), fmt, ##__VA_ARGS__)
#define CHROMA_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(chroma::log::logger(), fmt, ##__VA_ARGS__)
#define CHROMA_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(chroma::log::logger(), fmt, ##__VA_ARGS__)
