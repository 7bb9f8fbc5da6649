/**
 * @file Log.cpp
 * @brief Log dispatch and the default stderr sink.
 *
 * Simulators may render concurrently, so the active sink and the minimum
 * level are atomics and the stderr sink serializes its writes.
 */
#include "bio/core/Log.hpp"

#include <array>
#include <atomic>
#include <cstdio>
#include <mutex>

namespace bio::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::string_view name = kLevelNames[static_cast<usize>(level)];
        const std::scoped_lock lock(_mutex);
        std::fprintf(stderr, "[%-5.*s][%.*s] %.*s\n",
            static_cast<int>(name.size()), name.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data());
    }

private:
    std::mutex _mutex;
};

StderrLogger gStderrLogger;
std::atomic<ILogger *> gLogger{&gStderrLogger};
std::atomic<LogLevel> gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gLogger.load(std::memory_order_acquire)->write(level, tag, msg);
}

} // namespace

void Log::setLogger(ILogger *logger)
{
    gLogger.store(logger != nullptr ? logger : &gStderrLogger, std::memory_order_release);
}

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }

LogLevel Log::minLevel() { return gMinLevel.load(std::memory_order_relaxed); }

bool Log::enabled(LogLevel level) { return level >= minLevel(); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info(std::string_view tag, std::string_view msg)  { dispatch(LogLevel::kInfo, tag, msg); }
void Log::warn(std::string_view tag, std::string_view msg)  { dispatch(LogLevel::kWarn, tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace bio::core
