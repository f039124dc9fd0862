/**
 * @file TestLog.cpp
 * @brief Unit tests for the fdp::core::Log façade.
 */

#include <catch2/catch.hpp>

#include "fdp/core/Log.hpp"

#include <string>
#include <vector>

using namespace fdp::core;

namespace {

struct CapturingLogger final : ILogger {
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

struct LoggerGuard {
    explicit LoggerGuard(ILogger &logger) : previous{Log::minLevel()} { Log::setLogger(&logger); }
    ~LoggerGuard()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }
    LogLevel previous;
};

} // namespace

TEST_CASE("Log routes messages to the installed logger", "[core][log]")
{
    CapturingLogger sink;
    LoggerGuard guard{sink};
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("codec", "hello");
    Log::warn("world");

    REQUIRE(sink.entries.size() == 2);
    REQUIRE(sink.entries[0].level == LogLevel::kInfo);
    REQUIRE(sink.entries[0].tag == "codec");
    REQUIRE(sink.entries[0].message == "hello");
    REQUIRE(sink.entries[1].level == LogLevel::kWarn);
    REQUIRE(sink.entries[1].tag == "fdp");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    CapturingLogger sink;
    LoggerGuard guard{sink};
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("codec", "dropped");
    Log::info("codec", "dropped");
    Log::error("codec", "kept");

    REQUIRE(sink.entries.size() == 1);
    REQUIRE(sink.entries[0].message == "kept");
}

TEST_CASE("Log::setLogger(nullptr) restores the default sink", "[core][log]")
{
    CapturingLogger sink;
    {
        LoggerGuard guard{sink};
        Log::setMinLevel(LogLevel::kInfo);
        Log::info("before");
    }
    Log::info("after");

    REQUIRE(sink.entries.size() == 1);
    REQUIRE(sink.entries[0].message == "before");
}
