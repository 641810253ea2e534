/**
 * @file Logger.cpp
 * @brief Implementation of logging infrastructure
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * This implementation uses spdlog for sink management, formatting and
 * log file rotation.
 */

#include "Gsa/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Gsa {
namespace Core {

namespace {

constexpr size_t ROTATED_FILES = 3;

/// Strip the directory part of __FILE__
const char* baseName(const char* path) {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            name = p + 1;
        }
    }
    return name;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, const std::string& logFilePath,
                        size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (spdlogger_) {
        return false;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!logFilePath.empty()) {
            std::filesystem::path logPath(logFilePath);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, maxFileSizeMB * 1024 * 1024, ROTATED_FILES));
        }

        auto logger = std::make_shared<spdlog::logger>("gsaconf", sinks.begin(), sinks.end());

        // Pattern: [timestamp] [level] message
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->set_level(ToSpdlogLevel(minLevel));
        logger->flush_on(spdlog::level::warn);

        spdlogger_ = std::move(logger);
        minLevel_ = minLevel;
        return true;

    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Failed to create log directory: " << e.what() << std::endl;
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
    }
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spdlogger_ != nullptr && level >= minLevel_ && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    if (file && line > 0) {
        spdlogger_->log(ToSpdlogLevel(level), "({}:{}) {}", baseName(file), line, message);
    } else {
        spdlogger_->log(ToSpdlogLevel(level), "{}", message);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

std::optional<LogLevel> Logger::ParseLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")                        return LogLevel::Trace;
    if (lowered == "debug")                        return LogLevel::Debug;
    if (lowered == "info")                         return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error")                        return LogLevel::Error;
    if (lowered == "critical")                     return LogLevel::Critical;
    if (lowered == "off")                          return LogLevel::Off;
    return std::nullopt;
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace Core
} // namespace Gsa
