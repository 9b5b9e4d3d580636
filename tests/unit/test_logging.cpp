/**
 *  @file       test_logging.cpp
 *
 *  Unit tests for the logging level filter and sink.
 */

#include "pipa/core/logging.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using pipa::core::LogLevel;

namespace
{

struct CapturedLine
{
    LogLevel level;
    std::string message;
};

/**
 *  Installs a capturing sink for the lifetime of the object and restores
 *  the default sink and level afterwards.
 */
class SinkCapture
{
  public:
    SinkCapture()
    {
        pipa::core::setLogSink(
            [this](LogLevel level, const pipa::core::SourceLocation&, std::string_view message) {
                lines.push_back(CapturedLine{level, std::string{message}});
            });
    }

    ~SinkCapture()
    {
        pipa::core::setLogSink({});
        pipa::core::setLogLevel(LogLevel::kWarning);
    }

    SinkCapture(const SinkCapture&) = delete;
    auto operator=(const SinkCapture&) -> SinkCapture& = delete;

    std::vector<CapturedLine> lines;
};

}  // namespace

TEST_CASE("LogLevel toString", "[core][logging]")
{
    REQUIRE(pipa::core::toString(LogLevel::kTrace) == "TRACE");
    REQUIRE(pipa::core::toString(LogLevel::kDebug) == "DEBUG");
    REQUIRE(pipa::core::toString(LogLevel::kInfo) == "INFO");
    REQUIRE(pipa::core::toString(LogLevel::kWarning) == "WARNING");
    REQUIRE(pipa::core::toString(LogLevel::kError) == "ERROR");
}

TEST_CASE("Log level filters messages below the minimum", "[core][logging]")
{
    SinkCapture capture;
    pipa::core::setLogLevel(LogLevel::kInfo);

    PIPA_LOG_DEBUG("hidden {}", 1);
    PIPA_LOG_INFO("shown {}", 2);
    PIPA_LOG_ERROR("shown {}", 3);

    REQUIRE(capture.lines.size() == 2);
    REQUIRE(capture.lines[0].level == LogLevel::kInfo);
    REQUIRE(capture.lines[0].message == "shown 2");
    REQUIRE(capture.lines[1].level == LogLevel::kError);
    REQUIRE(capture.lines[1].message == "shown 3");
}

TEST_CASE("Log level kOff silences everything", "[core][logging]")
{
    SinkCapture capture;
    pipa::core::setLogLevel(LogLevel::kOff);

    PIPA_LOG_ERROR("dropped");

    REQUIRE(capture.lines.empty());
    REQUIRE_FALSE(pipa::core::isLogEnabled(LogLevel::kError));
}

TEST_CASE("Log level can be queried after being set", "[core][logging]")
{
    SinkCapture capture;

    pipa::core::setLogLevel(LogLevel::kTrace);
    REQUIRE(pipa::core::logLevel() == LogLevel::kTrace);
    REQUIRE(pipa::core::isLogEnabled(LogLevel::kTrace));

    pipa::core::setLogLevel(LogLevel::kError);
    REQUIRE_FALSE(pipa::core::isLogEnabled(LogLevel::kWarning));
}

TEST_CASE("A log sink may log from inside itself", "[core][logging]")
{
    std::vector<std::string> messages;
    pipa::core::setLogLevel(LogLevel::kInfo);
    pipa::core::setLogSink(
        [&messages](LogLevel level, const pipa::core::SourceLocation&, std::string_view message) {
            messages.emplace_back(message);
            if (level == LogLevel::kError)
            {
                PIPA_LOG_INFO("echo: {}", message);
            }
        });

    PIPA_LOG_ERROR("outer");

    pipa::core::setLogSink({});
    pipa::core::setLogLevel(LogLevel::kWarning);

    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0] == "outer");
    REQUIRE(messages[1] == "echo: outer");
}
