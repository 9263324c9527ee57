/**
 * @file Log.hpp
 * @brief Tagged logging façade with a swappable sink and a step context.
 *
 * Every line carries a subsystem tag ("CLOCK", "INPUT", "NET", "SYNC",
 * "SESSION") and, while a LogContext is alive, a context label such as
 * "server@120" naming the world and tick that produced it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_LOG_HPP
    #define TKS_CORE_LOG_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <string>
    #include <string_view>

namespace tks::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Parse "debug", "info", "warn", "error" or "fatal".
 * @return The level, or InvalidArgument for any other word.
 */
[[nodiscard]] Expected<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief One log line as handed to a sink.
 *
 * The views only live for the duration of ILogger::write.
 */
struct LogRecord {
    LogLevel         level;
    std::string_view tag;
    std::string_view context; ///< Empty outside any LogContext.
    std::string_view message;
};

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(const LogRecord &record) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Not thread-safe; the synchronization layer is single-threaded.
 */
class Log final {
public:
    Log() = delete;

    /// nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// Label of the innermost live LogContext, empty if none.
    [[nodiscard]] static std::string_view context();

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
    static void info (std::string_view tag, std::string_view msg) { write(LogLevel::kInfo,  tag, msg); }
    static void warn (std::string_view tag, std::string_view msg) { write(LogLevel::kWarn,  tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
    static void fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }

    /**
     * @brief Log the error held by @p result, if any, at @p level.
     * @return true when @p result failed.
     */
    template <typename T>
    static bool failed(std::string_view tag, const Expected<T> &result, LogLevel level = LogLevel::kWarn)
    {
        if (result.has_value())
            return false;
        write(level, tag, result.error().describe());
        return true;
    }

private:
    friend class LogContext;

    static std::string exchangeContext(std::string label);
};

/**
 * @brief Scoped context label attached to every line logged while alive.
 *
 * Contexts nest; destruction restores the enclosing label.
 */
class LogContext final {
public:
    explicit LogContext(std::string label) : _previous{Log::exchangeContext(std::move(label))} {}
    ~LogContext() { Log::exchangeContext(std::move(_previous)); }

    LogContext(const LogContext &)            = delete;
    LogContext &operator=(const LogContext &) = delete;

private:
    std::string _previous;
};

} // namespace tks::core

#endif // TKS_CORE_LOG_HPP
