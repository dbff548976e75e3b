// ============================================================================
// fanout/core/log.cpp - Library Logging Implementation
// ============================================================================

#include "fanout/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fanout {

namespace {

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> MakeLogger(const LoggerOptions& options) {
    // Not registered globally: two libraries using the name "fanout" must
    // not collide in spdlog's registry.
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(options.name, std::move(sink));
    logger->set_level(ToSpdlog(options.level));
    if (!options.pattern.empty()) {
        logger->set_pattern(options.pattern);
    }
    return logger;
}

struct LoggerHolder {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
};

LoggerHolder& Holder() {
    static LoggerHolder holder;
    return holder;
}

constexpr const char* kLogLevelEnv = "FANOUT_LOG_LEVEL";

}  // namespace

LoggerOptions LoggerOptions::FromEnv() {
    LoggerOptions options;
    if (const char* raw = std::getenv(kLogLevelEnv)) {
        if (auto level = ParseLogLevel(raw)) {
            options.level = *level;
        }
    }
    return options;
}

void InitLogger(const LoggerOptions& options) {
    auto logger = MakeLogger(options);
    auto& holder = Holder();
    std::lock_guard<std::mutex> lock(holder.mutex);
    holder.logger = std::move(logger);
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        return;
    }
    auto& holder = Holder();
    std::lock_guard<std::mutex> lock(holder.mutex);
    holder.logger = std::move(logger);
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

std::shared_ptr<spdlog::logger> GetLogger() {
    auto& holder = Holder();
    std::shared_ptr<spdlog::logger> created;
    {
        std::lock_guard<std::mutex> lock(holder.mutex);
        if (holder.logger) {
            return holder.logger;
        }
        holder.logger = MakeLogger(LoggerOptions::FromEnv());
        created = holder.logger;
    }

    // Reported once, by the call that created the logger
    const char* raw = std::getenv(kLogLevelEnv);
    if (raw != nullptr && !ParseLogLevel(raw)) {
        created->warn("ignoring {}='{}': unknown log level", kLogLevelEnv, raw);
    }
    return created;
}

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

}  // namespace fanout
