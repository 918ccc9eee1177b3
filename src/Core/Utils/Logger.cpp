/**
 * @file Logger.cpp
 * @brief spdlog-backed implementation of the diagnostic logger
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include "Warden/Core/Logger.hpp"
#include "Warden/Core/ErrorHandler.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace Warden {
namespace Core {

namespace {

constexpr size_t kRotatedFiles = 3;
constexpr size_t kCountedLevels = 6;

struct LevelName {
    LogLevel level;
    const char* name;
    spdlog::level::level_enum spdlogLevel;
};

constexpr std::array<LevelName, 8> kLevels = {{
    {LogLevel::Trace, "trace", spdlog::level::trace},
    {LogLevel::Debug, "debug", spdlog::level::debug},
    {LogLevel::Info, "info", spdlog::level::info},
    {LogLevel::Warning, "warning", spdlog::level::warn},
    {LogLevel::Warning, "warn", spdlog::level::warn},
    {LogLevel::Error, "error", spdlog::level::err},
    {LogLevel::Critical, "critical", spdlog::level::critical},
    {LogLevel::Off, "off", spdlog::level::off},
}};

spdlog::level::level_enum toSpdlog(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.spdlogLevel;
        }
    }
    return spdlog::level::info;
}

LogLevel fromSpdlog(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

/// "(file.cpp:42) message"
std::string withLocation(std::string_view message, const char* file, int line) {
    if (file == nullptr || line <= 0) {
        return std::string(message);
    }
    std::string_view path(file);
    const size_t slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        path.remove_prefix(slash + 1);
    }
    std::string out;
    out.reserve(path.size() + message.size() + 16);
    out.append("(").append(path).append(":").append(std::to_string(line)).append(") ");
    out.append(message);
    return out;
}

} // anonymous namespace

LogLevel ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : kLevels) {
        if (lowered == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Logger::Impl
// ============================================================================

class Logger::Impl {
public:
    /// Forwards records to the user callback; runs under Impl::mutex
    class CallbackSink final : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
    public:
        explicit CallbackSink(Impl& owner) : m_owner(owner) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            if (m_owner.callback) {
                m_owner.callback(fromSpdlog(msg.level),
                                 std::string_view(msg.payload.data(), msg.payload.size()),
                                 msg.time);
            }
        }

        void flush_() override {}

    private:
        Impl& m_owner;
    };

    bool start(LogLevel level, LogOutput outputs, const std::string& path, size_t maxFileSizeMB) {
        std::lock_guard<std::mutex> lock(mutex);
        if (logger) {
            return false;
        }

        std::vector<spdlog::sink_ptr> sinks;
        try {
            if (hasFlag(outputs, LogOutput::File) && !path.empty()) {
                const std::filesystem::path parent = std::filesystem::path(path).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path, maxFileSizeMB * 1024 * 1024, kRotatedFiles));
            }
            if (hasFlag(outputs, LogOutput::Callback)) {
                sinks.push_back(std::make_shared<CallbackSink>(*this));
            }
            if (hasFlag(outputs, LogOutput::Console) || sinks.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }

            auto created = std::make_shared<spdlog::logger>("warden", sinks.begin(), sinks.end());
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            created->set_level(toSpdlog(level));
            created->flush_on(spdlog::level::trace);
            logger = std::move(created);
        } catch (const std::exception& e) {
            std::cerr << "warden: cannot open log sinks: " << e.what() << std::endl;
            return false;
        }

        minLevel.store(level);
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (logger) {
            logger->flush();
            logger.reset();
        }
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex);
        return logger != nullptr && level != LogLevel::Off && level >= minLevel.load();
    }

    void count(LogLevel level) {
        const auto index = static_cast<size_t>(level);
        if (index < kCountedLevels) {
            counters[index].fetch_add(1, std::memory_order_relaxed);
        }
    }

    void emit(LogLevel level, std::string message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (logger) {
            logger->log(toSpdlog(level), Security::maskCredentials(message));
        }
    }

    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    LogCallback callback;

    std::atomic<LogLevel> minLevel{LogLevel::Info};
    std::array<std::atomic<size_t>, kCountedLevels> counters{};
    std::atomic<size_t> dropped{0};
};

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : m_impl(std::make_unique<Impl>()) {}

Logger::~Logger() {
    m_impl->stop();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    return m_impl->start(minLevel, outputs, logFilePath, maxFileSizeMB);
}

void Logger::Shutdown() {
    m_impl->stop();
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->minLevel.store(level);
    if (m_impl->logger) {
        m_impl->logger->set_level(toSpdlog(level));
    }
}

LogLevel Logger::GetMinLevel() const {
    return m_impl->minLevel.load();
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->callback = std::move(callback);
}

bool Logger::IsInitialized() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->logger != nullptr;
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    return m_impl->enabled(level);
}

void Logger::Log(LogLevel level, std::string_view message, const char* file, int line) {
    if (!m_impl->enabled(level)) {
        m_impl->dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    m_impl->count(level);
    m_impl->emit(level, withLocation(message, file, line));
}

void Logger::LogFormat(LogLevel level, const char* format, ...) {
    if (!m_impl->enabled(level)) {
        m_impl->dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    va_list args;
    va_start(args, format);
    va_list retry;
    va_copy(retry, args);

    std::array<char, 512> small{};
    const int needed = std::vsnprintf(small.data(), small.size(), format, args);
    va_end(args);

    std::string message;
    if (needed < 0) {
        message = format;
    } else if (static_cast<size_t>(needed) < small.size()) {
        message.assign(small.data(), static_cast<size_t>(needed));
    } else {
        message.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(message.data(), message.size(), format, retry);
        message.resize(static_cast<size_t>(needed));
    }
    va_end(retry);

    m_impl->count(level);
    m_impl->emit(level, std::move(message));
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (m_impl->logger) {
        m_impl->logger->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    const auto& c = m_impl->counters;
    Statistics stats;
    stats.trace = c[static_cast<size_t>(LogLevel::Trace)].load();
    stats.debug = c[static_cast<size_t>(LogLevel::Debug)].load();
    stats.info = c[static_cast<size_t>(LogLevel::Info)].load();
    stats.warning = c[static_cast<size_t>(LogLevel::Warning)].load();
    stats.error = c[static_cast<size_t>(LogLevel::Error)].load();
    stats.critical = c[static_cast<size_t>(LogLevel::Critical)].load();
    stats.dropped = m_impl->dropped.load();
    return stats;
}

void Logger::ResetStatistics() {
    for (auto& counter : m_impl->counters) {
        counter.store(0);
    }
    m_impl->dropped.store(0);
}

} // namespace Core
} // namespace Warden
