/**
 * @file TestLog.cpp
 * @brief Unit tests for the Log façade, LogContext and error propagation.
 */

#include <catch2/catch.hpp>

#include "tks/core/Expected.hpp"
#include "tks/core/Log.hpp"

#include <string>
#include <vector>

namespace tks::core {

namespace {

struct Line {
    LogLevel    level;
    std::string tag;
    std::string context;
    std::string message;
};

class CaptureLogger final : public ILogger {
public:
    void write(const LogRecord &record) override
    {
        lines.push_back({record.level, std::string{record.tag}, std::string{record.context},
                         std::string{record.message}});
    }

    std::vector<Line> lines;
};

/// Installs a capture sink for the scope of a test.
struct CaptureScope {
    CaptureScope()  { Log::setLogger(&sink); Log::setMinLevel(LogLevel::kDebug); }
    ~CaptureScope() { Log::setLogger(nullptr); Log::setMinLevel(LogLevel::kInfo); }

    CaptureLogger sink;
};

Expected<int> decodeCount(int raw)
{
    if (raw < 0)
        return makeError(ErrorCode::CorruptedData, "negative count");
    return raw;
}

ExpectedVoid applyEntity(int raw)
{
    TKS_TRY_WITHIN(decodeCount(raw), "entity 12");
    return {};
}

} // anonymous namespace

TEST_CASE("Log filters by level and forwards the tag", "[core][log]")
{
    CaptureScope capture;
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("SYNC", "hidden");
    Log::warn("NET", "shown");

    REQUIRE(capture.sink.lines.size() == 1);
    CHECK(capture.sink.lines[0].level == LogLevel::kWarn);
    CHECK(capture.sink.lines[0].tag == "NET");
    CHECK(capture.sink.lines[0].message == "shown");
    CHECK(capture.sink.lines[0].context.empty());
}

TEST_CASE("LogContext labels nest and restore", "[core][log]")
{
    CaptureScope capture;
    {
        const LogContext outer{"server@10"};
        Log::info("CLOCK", "a");
        {
            const LogContext inner{"peer 2@9"};
            Log::info("CLOCK", "b");
        }
        Log::info("CLOCK", "c");
    }
    Log::info("CLOCK", "d");

    REQUIRE(capture.sink.lines.size() == 4);
    CHECK(capture.sink.lines[0].context == "server@10");
    CHECK(capture.sink.lines[1].context == "peer 2@9");
    CHECK(capture.sink.lines[2].context == "server@10");
    CHECK(capture.sink.lines[3].context.empty());
    CHECK(Log::context().empty());
}

TEST_CASE("Log::failed reports only failures", "[core][log]")
{
    CaptureScope capture;

    CHECK_FALSE(Log::failed("INPUT", decodeCount(3)));
    CHECK(capture.sink.lines.empty());

    CHECK(Log::failed("INPUT", decodeCount(-1)));
    REQUIRE(capture.sink.lines.size() == 1);
    CHECK(capture.sink.lines[0].level == LogLevel::kWarn);
    CHECK(capture.sink.lines[0].message == "CORRUPTED_DATA negative count");
}

TEST_CASE("parseLogLevel accepts the level names only", "[core][log]")
{
    CHECK(parseLogLevel("debug").value() == LogLevel::kDebug);
    CHECK(parseLogLevel("fatal").value() == LogLevel::kFatal);

    auto bad = parseLogLevel("verbose");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("TKS_TRY_WITHIN prefixes the propagated message", "[core][error]")
{
    CHECK(applyEntity(1).has_value());

    auto result = applyEntity(-1);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::CorruptedData);
    CHECK(result.error().message() == "entity 12: negative count");
    CHECK(isRemoteFault(result.error().code()));
    CHECK_FALSE(isRemoteFault(ErrorCode::NotFound));
}

} // namespace tks::core
