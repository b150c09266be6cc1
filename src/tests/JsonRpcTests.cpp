// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpagent;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 42);
    CHECK(request["method"] == "test/method");
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse accepts a response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(!result->result.has_value());
}

TEST_CASE("parseResponse rejects server requests and notifications", "[jsonrpc]")
{
    auto notification = jsonrpc::makeNotification("notifications/progress", { { "progress", 1 } });
    auto request = jsonrpc::makeRequest(7, "sampling/createMessage");

    CHECK(!jsonrpc::parseResponse(notification).has_value());
    CHECK(!jsonrpc::parseResponse(request).has_value());
}

TEST_CASE("parseResponse rejects a response without id", "[jsonrpc]")
{
    auto missing = nlohmann::json { { "jsonrpc", "2.0" }, { "result", 1 } };
    auto null = nlohmann::json { { "jsonrpc", "2.0" }, { "id", nullptr }, { "result", 1 } };

    auto result = jsonrpc::parseResponse(missing);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(!jsonrpc::parseResponse(null).has_value());
}

TEST_CASE("parseResponse tolerates malformed error members", "[jsonrpc]")
{
    SECTION("string error")
    {
        auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", 3 }, { "error", "boom" } };
        auto result = jsonrpc::parseResponse(msg);
        REQUIRE(result.has_value());
        REQUIRE(result->error.has_value());
        CHECK(result->error->message == "boom");
    }

    SECTION("wrongly typed code")
    {
        auto msg = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", 3 },
            { "error", { { "code", "bad" }, { "message", "Oops" } } },
        };
        auto result = jsonrpc::parseResponse(msg);
        REQUIRE(result.has_value());
        REQUIRE(result->error.has_value());
        CHECK(result->error->code == 0);
        CHECK(result->error->message == "Oops");
    }
}

TEST_CASE("integerId only accepts integer ids", "[jsonrpc]")
{
    auto numeric = jsonrpc::parseResponse({ { "jsonrpc", "2.0" }, { "id", 12 }, { "result", nullptr } });
    auto text = jsonrpc::parseResponse({ { "jsonrpc", "2.0" }, { "id", "12" }, { "result", nullptr } });

    REQUIRE(numeric.has_value());
    REQUIRE(text.has_value());
    CHECK(numeric->integerId() == 12);
    CHECK(!text->integerId().has_value());
}

TEST_CASE("describe formats RPC errors", "[jsonrpc]")
{
    CHECK(jsonrpc::describe({ .code = -32601, .message = "Method not found", .data = {} })
          == "RPC error -32601: Method not found");
    CHECK(jsonrpc::describe({ .code = 1, .message = "x", .data = { { "k", 2 } } }) == R"(RPC error 1: x ({"k":2}))");
}
