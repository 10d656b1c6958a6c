#pragma once

#include <string>

namespace fv {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

/// Parse "debug" / "info" / "warn" / "error".  Unknown strings map to info.
LogLevel log_level_from_string(const std::string& s);

/// Open (append) a log file in addition to stderr.  Safe to call again to
/// switch files; an empty path closes the current file.
void log_init(const std::string& path);

/// Flush and close the log file, if any.
void log_shutdown();

/// Lines below this level are discarded.  Defaults to info.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Write one line: [timestamp][LEVEL][tag] message.  Thread-safe.
void log_message(LogLevel level, const std::string& tag, const std::string& msg);

} // namespace fv

#define FV_LOG_DEBUG(tag, msg) ::fv::log_message(::fv::LogLevel::debug, tag, msg)
#define FV_LOG_INFO(tag, msg)  ::fv::log_message(::fv::LogLevel::info,  tag, msg)
#define FV_LOG_WARN(tag, msg)  ::fv::log_message(::fv::LogLevel::warn,  tag, msg)
#define FV_LOG_ERROR(tag, msg) ::fv::log_message(::fv::LogLevel::error, tag, msg)
