// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <utility>
#include <vector>

using namespace mcpagent;

namespace
{

/// @brief Routes log output into a vector for the lifetime of the object.
class CapturedLog
{
  public:
    CapturedLog(): _previousLevel(log::getLevel())
    {
        log::setCallback([this](log::Level level, std::string_view message) {
            _records.emplace_back(level, std::string(message));
        });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(_previousLevel);
    }

    [[nodiscard]] auto records() const -> const std::vector<std::pair<log::Level, std::string>>& { return _records; }

  private:
    log::Level _previousLevel;
    std::vector<std::pair<log::Level, std::string>> _records;
};

} // namespace

TEST_CASE("log routes formatted messages to the callback", "[log]")
{
    auto captured = CapturedLog {};
    log::setLevel(log::Level::Info);

    log::info("Connected to {} servers", 3);
    log::error("Failed: {}", "boom");

    REQUIRE(captured.records().size() == 2);
    CHECK(captured.records()[0].first == log::Level::Info);
    CHECK(captured.records()[0].second == "Connected to 3 servers");
    CHECK(captured.records()[1].first == log::Level::Error);
}

TEST_CASE("log filters messages above the global level", "[log]")
{
    auto captured = CapturedLog {};
    log::setLevel(log::Level::Warning);

    log::debug("hidden");
    log::info("hidden");
    log::warning("shown");

    REQUIRE(captured.records().size() == 1);
    CHECK(captured.records()[0].second == "shown");
}

TEST_CASE("log levels parse from their names", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("loud").has_value());
}

TEST_CASE("Errors format with their code name", "[log]")
{
    auto const error = Error { ErrorCode::TimeoutError, "Timeout waiting for response to tools/call" };
    CHECK(std::format("{}", error) == "[TimeoutError] Timeout waiting for response to tools/call");
}
