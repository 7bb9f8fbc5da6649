/**
 * @file Log.hpp
 * @brief Tagged diagnostics for the synthesizers.
 *
 * Messages carry a subsystem tag (NOISE, EMG, ECG, EOG, SIM) and are
 * dropped below the runtime minimum level, which SimulatorFactory sets
 * from SimulatorConfig. Output goes to stderr unless an application
 * installs its own ILogger; the sink is not owned and must outlive its
 * installation.
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_LOG_HPP
    #define BIO_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace bio::core {

/** @brief Message severity, in increasing order. */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/** @brief Destination for messages that pass the level filter. */
class ILogger {
public:
    virtual ~ILogger() = default;

    /** @brief Called concurrently if simulators run on several threads. */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/** @brief Process-wide entry point; never instantiated. */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /** @brief True if a message at @p level would reach the sink. Use it to skip building debug text. */
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("bio", msg); }
    static void info (std::string_view msg) { info ("bio", msg); }
    static void warn (std::string_view msg) { warn ("bio", msg); }
    static void error(std::string_view msg) { error("bio", msg); }
    static void fatal(std::string_view msg) { fatal("bio", msg); }
};

} // namespace bio::core

#endif // BIO_CORE_LOG_HPP
