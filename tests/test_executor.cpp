#include <catch2/catch_test_macros.hpp>
#include "executor.hpp"
#include "mock_http_client.hpp"

using namespace dgadmin;

static EndpointConfig endpoint(const char* auth = nullptr) {
    return EndpointConfig::make("http://db:8080",
        auth ? std::optional<std::string>(auth) : std::nullopt);
}

// ── classify_response ────────────────────────────────────────────

TEST_CASE("classify_response: 200 is success with raw body", "[executor]") {
    auto o = classify_response({200, R"({"data":{"code":"Success"}})", ""});
    REQUIRE(o.kind == OutcomeKind::Success);
    REQUIRE(o.body == R"({"data":{"code":"Success"}})");
    REQUIRE(o == Outcome::success(R"({"data":{"code":"Success"}})"));
}

TEST_CASE("classify_response: whole 2xx range is success", "[executor]") {
    REQUIRE(classify_response({201, "created", ""}) == Outcome::success("created"));
    REQUIRE(classify_response({204, "", ""}) == Outcome::success(""));
    REQUIRE(classify_response({299, "x", ""}).ok());
}

TEST_CASE("classify_response: non-2xx is application error, body verbatim", "[executor]") {
    for (long code : {100L, 199L, 301L, 304L, 400L, 401L, 403L, 404L, 500L, 503L}) {
        std::string body = "{\"errors\":[{\"message\":\"boom " + std::to_string(code) + "\"}]}";
        auto o = classify_response({code, body, ""});
        REQUIRE(o.kind == OutcomeKind::ApplicationError);
        REQUIRE(o.status_code == code);
        REQUIRE(o.body == body);
    }
}

TEST_CASE("classify_response: no status is a transport error", "[executor]") {
    auto o = classify_response({0, "", "failed to connect to db:8080: Connection refused"});
    REQUIRE(o.kind == OutcomeKind::TransportError);
    REQUIRE(o.cause == "failed to connect to db:8080: Connection refused");
    REQUIRE(o.status_code == 0);
}

TEST_CASE("classify_response: transport error always has a cause", "[executor]") {
    auto o = classify_response({});
    REQUIRE(o.kind == OutcomeKind::TransportError);
    REQUIRE_FALSE(o.cause.empty());
}

// ── execute ──────────────────────────────────────────────────────

TEST_CASE("execute: GET joins base URL and path", "[executor]") {
    MockHttpClient http;
    http.next_response = {200, R"([{"status":"healthy"}])", ""};

    auto desc = resolve(Command::get_health(), endpoint());
    auto o = execute(desc, endpoint(), http, 7);

    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_method == "GET");
    REQUIRE(http.last_url == "http://db:8080/admin/health");
    REQUIRE(http.last_timeout == 7);
    REQUIRE(o == Outcome::success(R"([{"status":"healthy"}])"));
}

TEST_CASE("execute: POST sends body and all headers", "[executor]") {
    MockHttpClient http;
    http.next_response = {200, "ok", ""};
    auto ep = endpoint("X-Dgraph-AuthToken:abc");

    auto desc = resolve(Command::update_schema(std::string("name: string .")), ep);
    auto o = execute(desc, ep, http);

    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url == "http://db:8080/alter");
    REQUIRE(http.last_body == "name: string .");
    REQUIRE(http.header("X-Dgraph-AuthToken") == "abc");
    REQUIRE(http.header("Content-Type") == "application/dql");
    REQUIRE(http.last_timeout == kDefaultTimeoutSeconds);
    REQUIRE(o.ok());
}

TEST_CASE("execute: drop sends JSON payload", "[executor]") {
    MockHttpClient http;
    http.next_response = {200, R"({"data":{"code":"Success","message":"Done"}})", ""};

    auto o = execute(resolve(Command::drop_data(), endpoint()), endpoint(), http);
    REQUIRE(http.last_body == R"({"drop_op":"data"})");
    REQUIRE(http.header("Content-Type") == "application/json");
    REQUIRE(o.body == R"({"data":{"code":"Success","message":"Done"}})");
}

TEST_CASE("execute: server rejection passes through", "[executor]") {
    MockHttpClient http;
    http.next_response = {400, R"({"errors":[{"message":"invalid schema"}]})", ""};

    auto o = execute(resolve(Command::drop_all(), endpoint()), endpoint(), http);
    REQUIRE(o == Outcome::application_error(400, R"({"errors":[{"message":"invalid schema"}]})"));
}

TEST_CASE("execute: transport failure is reported once, never retried", "[executor]") {
    MockHttpClient http;
    http.next_response = {0, "", "request timed out after 30 seconds"};

    auto o = execute(resolve(Command::drop_all(), endpoint()), endpoint(), http);
    REQUIRE(http.call_count == 1);
    REQUIRE(o == Outcome::transport_error("request timed out after 30 seconds"));
}

TEST_CASE("execute: 5xx is not retried either", "[executor]") {
    MockHttpClient http;
    http.next_response = {503, "unavailable", ""};

    auto o = execute(resolve(Command::get_schema(), endpoint()), endpoint(), http);
    REQUIRE(http.call_count == 1);
    REQUIRE(o.kind == OutcomeKind::ApplicationError);
    REQUIRE(o.status_code == 503);
}
