#include <catch2/catch_test_macros.hpp>
#include "report.hpp"
#include <sstream>

using namespace dgadmin;

// ── exit_code_for ────────────────────────────────────────────────

TEST_CASE("exit_code_for: one code per outcome kind", "[report]") {
    REQUIRE(exit_code_for(Outcome::success("{}")) == kExitSuccess);
    REQUIRE(exit_code_for(Outcome::application_error(400, "bad")) == kExitApplicationError);
    REQUIRE(exit_code_for(Outcome::transport_error("refused")) == kExitTransportError);
}

// ── render_health ────────────────────────────────────────────────

TEST_CASE("render_health: one line per node", "[report]") {
    std::string body = R"([
        {"instance":"zero","address":"zero:5080","status":"healthy","uptime":90061},
        {"instance":"alpha","address":"alpha:7080","status":"healthy","uptime":59}
    ])";
    REQUIRE(render_health(body) ==
            "zero:5080 is healthy, uptime: 1day 1h 1m 1s\n"
            "alpha:7080 is healthy, uptime: 59s\n");
}

TEST_CASE("render_health: single node object", "[report]") {
    REQUIRE(render_health(R"({"address":"localhost:7080","status":"unhealthy","uptime":0})") ==
            "localhost:7080 is unhealthy, uptime: 0s\n");
}

TEST_CASE("render_health: node without address or status passes through", "[report]") {
    REQUIRE(render_health(R"({"status":"healthy"})") == R"({"status":"healthy"})");
    REQUIRE(render_health(R"({"address":"a:7080","status":1})") ==
            R"({"address":"a:7080","status":1})");
    std::string mixed = R"([{"address":"a:7080","status":"healthy"},{"instance":"zero"}])";
    REQUIRE(render_health(mixed) == mixed);
}

TEST_CASE("render_health: errors body is not a node", "[report]") {
    std::string body = R"({"errors":[{"message":"no alpha"}]})";
    REQUIRE(render_health(body) == body);
    REQUIRE(render_success(CommandKind::GetHealth, body, OutputMode::Pretty) == body + "\n");
}

TEST_CASE("render_health: empty node list passes through", "[report]") {
    REQUIRE(render_health("[]") == "[]");
}

TEST_CASE("render_health: unrecognised bodies pass through", "[report]") {
    REQUIRE(render_health("OK") == "OK");
    REQUIRE(render_health("42") == "42");
    REQUIRE(render_health(R"([1, 2])") == "[1, 2]");
}

// ── render_schema ────────────────────────────────────────────────

TEST_CASE("render_schema: GraphQL admin shape", "[report]") {
    std::string body = R"({"data":{"getGQLSchema":{"schema":"type Person {\n  name: String\n}\n"}}})";
    REQUIRE(render_schema(body) == "type Person {\n  name: String\n}\n");
}

TEST_CASE("render_schema: top-level schema field", "[report]") {
    REQUIRE(render_schema(R"({"schema":"name: string ."})") == "name: string .\n");
}

TEST_CASE("render_schema: null or empty is no schema", "[report]") {
    REQUIRE(render_schema(R"({"data":{"getGQLSchema":null}})") == "no schema\n");
    REQUIRE(render_schema(R"({"data":{"getGQLSchema":{"schema":""}}})") == "no schema\n");
    REQUIRE(render_schema(R"({"schema":null})") == "no schema\n");
    REQUIRE(render_schema("   \n") == "no schema\n");
}

TEST_CASE("render_schema: plain text is trimmed", "[report]") {
    REQUIRE(render_schema("\nname: string .\n\n") == "name: string .\n");
}

TEST_CASE("render_schema: other JSON passes through", "[report]") {
    REQUIRE(render_schema(R"({"data":{"other":1}})") == R"({"data":{"other":1}})");
    REQUIRE(render_schema(R"({"schema":5})") == R"({"schema":5})");
}

// ── render_success ───────────────────────────────────────────────

TEST_CASE("render_success: raw mode prints body with one trailing newline", "[report]") {
    REQUIRE(render_success(CommandKind::GetHealth, R"({"status":"healthy"})", OutputMode::Raw) ==
            "{\"status\":\"healthy\"}\n");
    REQUIRE(render_success(CommandKind::GetSchema, "text\n", OutputMode::Raw) == "text\n");
    REQUIRE(render_success(CommandKind::DropAll, "", OutputMode::Raw).empty());
}

TEST_CASE("render_success: pretty mode per command", "[report]") {
    std::string done = R"({"data":{"code":"Success","message":"Done"}})";
    REQUIRE(render_success(CommandKind::DropAll, done, OutputMode::Pretty) == "success\n");
    REQUIRE(render_success(CommandKind::DropData, done, OutputMode::Pretty) == "success\n");
    REQUIRE(render_success(CommandKind::UpdateSchema, done, OutputMode::Pretty) == "success\n");
    REQUIRE(render_success(CommandKind::GetSchema, R"({"schema":null})", OutputMode::Pretty) ==
            "no schema\n");
    REQUIRE(render_success(CommandKind::GetHealth,
                           R"([{"address":"a:7080","status":"healthy","uptime":60}])",
                           OutputMode::Pretty) == "a:7080 is healthy, uptime: 1m\n");
}

TEST_CASE("render_success: alter reply with errors is printed as-is", "[report]") {
    std::string body = R"({"errors":[{"message":"Operation not allowed"}]})";
    for (auto kind : {CommandKind::DropAll, CommandKind::DropData, CommandKind::UpdateSchema})
        REQUIRE(render_success(kind, body, OutputMode::Pretty) == body + "\n");
}

TEST_CASE("render_success: alter reply without a Success code is printed as-is", "[report]") {
    REQUIRE(render_success(CommandKind::DropAll, "{}", OutputMode::Pretty) == "{}\n");
    REQUIRE(render_success(CommandKind::DropAll, "done", OutputMode::Pretty) == "done\n");
    REQUIRE(render_success(CommandKind::DropData, R"({"data":{"code":"Failure"}})",
                           OutputMode::Pretty) == "{\"data\":{\"code\":\"Failure\"}}\n");
}

TEST_CASE("is_alter_success: requires data.code Success and no errors", "[report]") {
    REQUIRE(is_alter_success(R"({"data":{"code":"Success","message":"Done"}})"));
    REQUIRE_FALSE(is_alter_success(
        R"({"data":{"code":"Success"},"errors":[{"message":"partial"}]})"));
    REQUIRE_FALSE(is_alter_success(R"({"data":null})"));
    REQUIRE_FALSE(is_alter_success(""));
}

// ── report_outcome ───────────────────────────────────────────────

TEST_CASE("report_outcome: success goes to stdout only", "[report]") {
    std::ostringstream out, err;
    int code = report_outcome(Outcome::success("{}"), CommandKind::GetSchema,
                              OutputMode::Raw, out, err);
    REQUIRE(code == kExitSuccess);
    REQUIRE(out.str() == "{}\n");
    REQUIRE(err.str().empty());
}

TEST_CASE("report_outcome: application error shows status and body", "[report]") {
    std::ostringstream out, err;
    int code = report_outcome(Outcome::application_error(400, R"({"errors":[]})"),
                              CommandKind::UpdateSchema, OutputMode::Pretty, out, err);
    REQUIRE(code == kExitApplicationError);
    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "Error: server returned HTTP 400\n{\"errors\":[]}\n");
}

TEST_CASE("report_outcome: application error with empty body", "[report]") {
    std::ostringstream out, err;
    report_outcome(Outcome::application_error(404, ""), CommandKind::GetHealth,
                   OutputMode::Raw, out, err);
    REQUIRE(err.str() == "Error: server returned HTTP 404\n");
}

TEST_CASE("report_outcome: transport error on a read has no warning", "[report]") {
    std::ostringstream out, err;
    int code = report_outcome(Outcome::transport_error("could not resolve host: db"),
                              CommandKind::GetHealth, OutputMode::Raw, out, err);
    REQUIRE(code == kExitTransportError);
    REQUIRE(err.str() == "Error: request failed: could not resolve host: db\n");
}

TEST_CASE("report_outcome: transport error on a drop warns about unknown state", "[report]") {
    for (auto kind : {CommandKind::DropAll, CommandKind::DropData}) {
        std::ostringstream out, err;
        report_outcome(Outcome::transport_error("request timed out after 30 seconds"),
                       kind, OutputMode::Raw, out, err);
        REQUIRE(err.str().find("may or may not have been applied") != std::string::npos);
        REQUIRE(err.str().find(command_name(kind)) != std::string::npos);
    }
}
