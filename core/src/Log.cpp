/**
 * @file Log.cpp
 * @brief Log façade state and the default stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tks/core/Log.hpp"

#include <array>
#include <cstdio>
#include <format>
#include <utility>

namespace tks::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames = {
    "debug", "info", "warn", "error", "fatal"
};

class StderrLogger final : public ILogger {
public:
    void write(const LogRecord &record) override
    {
        static constexpr const char *kLabels[] = {"DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

        std::string line = std::format("[{}][{}] ", kLabels[static_cast<unsigned>(record.level)], record.tag);
        if (!record.context.empty())
        {
            line += std::format("{} | ", record.context);
        }
        line += record.message;
        line += '\n';
        std::fputs(line.c_str(), stderr);
        if (record.level >= LogLevel::kError)
        {
            std::fflush(stderr);
        }
    }
};

StderrLogger gDefaultLogger;
ILogger     *gActiveLogger = &gDefaultLogger;
LogLevel     gMinLevel     = LogLevel::kInfo;
std::string  gContext;

} // anonymous namespace

Expected<LogLevel> parseLogLevel(std::string_view name)
{
    for (std::size_t i = 0; i < kLevelNames.size(); ++i)
    {
        if (kLevelNames[i] == name)
            return static_cast<LogLevel>(i);
    }
    return makeError(ErrorCode::InvalidArgument, std::format("unknown log level '{}'", name));
}

void Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }
std::string_view Log::context()       { return gContext; }

std::string Log::exchangeContext(std::string label)
{
    return std::exchange(gContext, std::move(label));
}

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel)
        return;
    gActiveLogger->write(LogRecord{level, tag, gContext, msg});
}

} // namespace tks::core
