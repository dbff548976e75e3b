// ============================================================================
// fanout/core/log.hpp - Library Logging
// ============================================================================
//
// The engine logs through a single named spdlog logger ("fanout" by default)
// writing to stderr. Applications can re-initialize it with their own name,
// level and pattern, or replace it with a logger of their own.
//
// LEVELS USED BY THE ENGINE:
// --------------------------
//   debug - pool start/stop, shutdown mode, rejected submissions, deadlines
//   warn  - a task body threw and was converted into a recovered failure
//   error - internal invariants the engine could still survive
//
// USAGE:
// ------
//   fanout::InitLogger({.name = "myapp", .level = fanout::LogLevel::Debug});
//   fanout::InitLogger(fanout::LoggerOptions::FromEnv());
//   fanout::GetLogger()->info("batch of {} tasks", n);
//
// ============================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace fanout {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off,
};

struct LoggerOptions {
    std::string name = "fanout";
    LogLevel level = LogLevel::Warn;
    // spdlog pattern; empty keeps spdlog's default
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v";

    // Defaults with `level` overridden by FANOUT_LOG_LEVEL when it parses
    static LoggerOptions FromEnv();
};

// Replace the library logger with a fresh stderr logger
void InitLogger(const LoggerOptions& options);

// Install an externally configured logger (e.g. with file sinks)
void SetLogger(std::shared_ptr<spdlog::logger> logger);

void SetLogLevel(LogLevel level);

// Never null; created from LoggerOptions::FromEnv() on first use
std::shared_ptr<spdlog::logger> GetLogger();

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical",
// "off" (case-insensitive)
std::optional<LogLevel> ParseLogLevel(std::string_view text);

}  // namespace fanout
