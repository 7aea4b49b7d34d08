#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/facade.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/router.hpp"
#include "mcp/server.hpp"
#include "mcp/tool_args.hpp"
#include "mcp/tools.hpp"

using context_mcp::engine::Activity;
using context_mcp::engine::BlacklistAction;
using context_mcp::engine::BlacklistKind;
using context_mcp::engine::ContextSuggestions;
using context_mcp::engine::EngineError;
using context_mcp::engine::EngineFacade;
using context_mcp::engine::EngineState;
using context_mcp::engine::EngineStats;
using context_mcp::engine::Prediction;
using context_mcp::engine::PrivacyStats;
using context_mcp::engine::RelatedActivity;
using context_mcp::engine::SearchResult;
using context_mcp::engine::WorkContext;
using context_mcp::mcp::Server;
using context_mcp::mcp::SessionState;
using context_mcp::mcp::build_tool_registry;
using nlohmann::json;

namespace {

class FakeEngine final : public EngineFacade {
 public:
  EngineState engine_state{EngineState::ready};
  int cleanup_calls{0};
  int last_cleanup_days{0};
  int last_recent_hours{0};
  int last_recent_limit{0};
  std::int64_t deleted_records{7};
  bool fail_search{false};
  std::string recent_title{"main.cpp"};
  std::vector<std::string> blacklist_log;

  [[nodiscard]] EngineState state() const override { return engine_state; }
  [[nodiscard]] std::string unavailable_reason() const override {
    return engine_state == EngineState::ready ? "" : "redis unreachable";
  }

  std::vector<Activity> recent_activities(const int hours, const int limit) override {
    last_recent_hours = hours;
    last_recent_limit = limit;
    return {Activity{.id = "a1", .timestamp_ms = 1000, .app_name = "code", .window_title = recent_title}};
  }

  std::vector<SearchResult> search(const std::string& query, int) override {
    if (fail_search) {
      throw EngineError("vector store offline");
    }
    return {SearchResult{Activity{.id = "a2", .window_title = query}, 0.75}};
  }

  std::vector<Prediction> predict(const std::string&, int) override { return {}; }

  ContextSuggestions suggestions(const std::string&) override {
    return ContextSuggestions{.related_files = {"/src/main.cpp"}, .related_apps = {"code"}};
  }

  std::vector<RelatedActivity> related(const std::string& activity_id, int) override {
    throw EngineError("activity not found: " + activity_id);
  }

  EngineStats stats() override { return EngineStats{.activity_count = 3, .context_count = 1}; }

  std::vector<WorkContext> list_contexts(int) override { return {WorkContext{.id = "ctx-1", .name = "release"}}; }

  std::int64_t cleanup(const int days) override {
    ++cleanup_calls;
    last_cleanup_days = days;
    return deleted_records;
  }

  PrivacyStats update_blacklist(const BlacklistKind kind, const std::string& value,
                                const BlacklistAction action) override {
    blacklist_log.push_back(std::string(action == BlacklistAction::add ? "add:" : "remove:") +
                            (kind == BlacklistKind::app ? "app:" : "directory:") + value);
    return PrivacyStats{.blacklisted_apps = {value}};
  }

  std::string create_context(const std::string&, const std::string&, const std::vector<std::string>&) override {
    return "ctx-9";
  }
};

struct Session {
  std::vector<json> responses;
  std::string diagnostics;
};

Session run_session(Server& server, const std::string& input) {
  std::istringstream in(input);
  std::ostringstream out;
  std::ostringstream err;
  server.run(in, out, err);

  Session session;
  session.diagnostics = err.str();
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    session.responses.push_back(json::parse(line));
  }
  return session;
}

json tool_payload(const json& response) {
  return json::parse(response.at("result").at("content").at(0).at("text").get<std::string>());
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_tools_list_returns_fixed_catalog_in_order() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n");

  if (session.responses.size() != 1) {
    return fail("test_tools_list_returns_fixed_catalog_in_order", "expected exactly one response");
  }

  const std::vector<std::string> expected = {
      "context_recent_activities", "context_search",        "context_predict", "context_suggestions",
      "context_related",           "context_stats",         "context_list_contexts",
      "context_cleanup",           "context_privacy_blacklist", "context_create_context",
  };
  const auto& tools = session.responses[0].at("result").at("tools");
  if (tools.size() != expected.size()) {
    return fail("test_tools_list_returns_fixed_catalog_in_order", "catalog should contain ten tools");
  }
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (tools[i].at("name") != expected[i]) {
      return fail("test_tools_list_returns_fixed_catalog_in_order", "tool order mismatch");
    }
    if (!tools[i].contains("description") || !tools[i].at("inputSchema").is_object()) {
      return fail("test_tools_list_returns_fixed_catalog_in_order", "descriptor missing description or schema");
    }
  }

  if (tools[1].at("inputSchema").at("required") != json::array({"query"})) {
    return fail("test_tools_list_returns_fixed_catalog_in_order", "context_search should require query");
  }
  if (tools[7].at("inputSchema").at("properties").at("days").at("default") != 90) {
    return fail("test_tools_list_returns_fixed_catalog_in_order", "context_cleanup days default should be 90");
  }

  return 0;
}

int test_tools_list_is_empty_when_engine_unavailable() {
  FakeEngine engine;
  engine.engine_state = EngineState::unavailable;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(server, R"({"jsonrpc":"2.0","id":"list","method":"tools/list"})" "\n");

  if (session.responses.size() != 1 || session.responses[0].at("result") != json{{"tools", json::array()}}) {
    return fail("test_tools_list_is_empty_when_engine_unavailable", "expected {\"tools\": []}");
  }
  return 0;
}

int test_initialize_succeeds_and_is_idempotent() {
  FakeEngine engine;
  engine.engine_state = EngineState::unavailable;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(server,
                                   R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
                                   R"({"jsonrpc":"2.0","id":2,"method":"initialize"})" "\n");

  if (session.responses.size() != 2) {
    return fail("test_initialize_succeeds_and_is_idempotent", "expected two responses");
  }

  const auto& first = session.responses[0].at("result");
  if (first.at("protocolVersion") != "2024-11-05" || first.at("capabilities") != json{{"tools", json::object()}} ||
      first.at("serverInfo").at("name") != "context-continuity" || first.at("serverInfo").at("version") != "1.0.0") {
    return fail("test_initialize_succeeds_and_is_idempotent", "initialize result shape mismatch");
  }
  if (session.responses[1].at("result") != first) {
    return fail("test_initialize_succeeds_and_is_idempotent", "second initialize should return the same result");
  }
  if (server.router().state() != SessionState::initialized) {
    return fail("test_initialize_succeeds_and_is_idempotent", "router should be initialized");
  }
  return 0;
}

int test_notifications_are_processed_silently() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session =
      run_session(server,
                  R"({"jsonrpc":"2.0","id":1,"method":"initialize"})" "\n"
                  R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
                  R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"context_cleanup","arguments":{}}})" "\n"
                  R"({"jsonrpc":"2.0","method":"no/such/method"})" "\n"
                  R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})" "\n");

  if (session.responses.size() != 1 || session.responses[0].at("id") != 1) {
    return fail("test_notifications_are_processed_silently", "only the initialize request may be answered");
  }
  if (server.router().state() != SessionState::serving) {
    return fail("test_notifications_are_processed_silently", "notifications/initialized should enter serving");
  }
  if (engine.cleanup_calls != 1) {
    return fail("test_notifications_are_processed_silently", "tools/call notification should still run the tool");
  }
  return 0;
}

int test_every_request_gets_one_response_with_its_id() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session =
      run_session(server,
                  R"({"jsonrpc":"2.0","id":"alpha","method":"tools/list"})" "\n"
                  R"({"jsonrpc":"2.0","id":42,"method":"bogus"})" "\n"
                  R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"context_stats"}})" "\n"
                  R"({"jsonrpc":"2.0","id":8,"method":"notifications/initialized"})" "\n"
                  R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"context_related","arguments":{"activity_id":"x"}}})" "\n");

  const std::vector<json> expected_ids = {"alpha", 42, 7, 8, 9};
  if (session.responses.size() != expected_ids.size()) {
    return fail("test_every_request_gets_one_response_with_its_id", "response count mismatch");
  }
  for (std::size_t i = 0; i < expected_ids.size(); ++i) {
    const auto& response = session.responses[i];
    if (response.at("id") != expected_ids[i] || response.at("jsonrpc") != "2.0") {
      return fail("test_every_request_gets_one_response_with_its_id", "response id or order mismatch");
    }
    if (response.contains("result") == response.contains("error")) {
      return fail("test_every_request_gets_one_response_with_its_id", "exactly one of result/error expected");
    }
  }
  return 0;
}

int test_unknown_method_and_tool_are_method_not_found() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session =
      run_session(server,
                  R"({"jsonrpc":"2.0","id":1,"method":"resources/list"})" "\n"
                  R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"context_teleport","arguments":{}}})" "\n"
                  R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"Context_Stats"}})" "\n");

  if (session.responses.size() != 3) {
    return fail("test_unknown_method_and_tool_are_method_not_found", "expected three responses");
  }

  const auto& method_error = session.responses[0].at("error");
  if (method_error.at("code") != -32601 || method_error.at("message") != "Unknown method: resources/list") {
    return fail("test_unknown_method_and_tool_are_method_not_found", "unknown method error mismatch");
  }

  const auto& tool_error = session.responses[1].at("error");
  if (tool_error.at("code") != -32601 ||
      tool_error.at("message").get<std::string>().find("context_teleport") == std::string::npos) {
    return fail("test_unknown_method_and_tool_are_method_not_found", "unknown tool error should name the tool");
  }

  if (!session.responses[2].contains("error")) {
    return fail("test_unknown_method_and_tool_are_method_not_found", "tool lookup must be case-sensitive");
  }
  return 0;
}

int test_handler_failure_is_reported_in_band() {
  FakeEngine engine;
  engine.fail_search = true;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server, R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"context_search","arguments":{"query":"build"}}})" "\n");

  if (session.responses.size() != 1) {
    return fail("test_handler_failure_is_reported_in_band", "expected one response");
  }
  const auto& response = session.responses[0];
  if (response.contains("error")) {
    return fail("test_handler_failure_is_reported_in_band", "handler failure must not be a JSON-RPC error");
  }
  if (response.at("result").at("isError") != true) {
    return fail("test_handler_failure_is_reported_in_band", "isError should be true");
  }
  const auto payload = tool_payload(response);
  if (payload.at("status") != "error" || payload.at("message") != "vector store offline") {
    return fail("test_handler_failure_is_reported_in_band", "failure text should carry the engine message");
  }
  if (session.diagnostics.find("[server] tool context_search failed: vector store offline") == std::string::npos) {
    return fail("test_handler_failure_is_reported_in_band", "failure should be logged to the server error stream");
  }
  return 0;
}

int test_cleanup_defaults_to_ninety_days() {
  FakeEngine engine;
  engine.deleted_records = 12;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"context_cleanup","arguments":{}}})" "\n");

  if (session.responses.size() != 1 || engine.last_cleanup_days != 90) {
    return fail("test_cleanup_defaults_to_ninety_days", "cleanup should run with days=90");
  }

  const auto& result = session.responses[0].at("result");
  if (result.contains("isError")) {
    return fail("test_cleanup_defaults_to_ninety_days", "successful call must not set isError");
  }
  if (result.at("content").size() != 1 || result.at("content")[0].at("type") != "text") {
    return fail("test_cleanup_defaults_to_ninety_days", "expected a single text content block");
  }

  const json expected{{"status", "success"}, {"deleted_records", 12}, {"retention_days", 90}};
  if (tool_payload(session.responses[0]) != expected) {
    return fail("test_cleanup_defaults_to_ninety_days", "cleanup payload mismatch");
  }
  return 0;
}

int test_malformed_line_does_not_poison_stream() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(server,
                                   "this is not json\n"
                                   "{\"jsonrpc\":\"2.0\",\"id\":\n"
                                   "[1,2,3]\n"
                                   "\n"
                                   R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})" "\r\n");

  if (session.responses.size() != 1 || session.responses[0].at("id") != 3) {
    return fail("test_malformed_line_does_not_poison_stream", "well-formed request should still be answered");
  }
  if (session.responses[0].at("result").at("tools").size() != 10) {
    return fail("test_malformed_line_does_not_poison_stream", "tools/list result should be complete");
  }
  if (session.diagnostics.find("[server] invalid JSON") == std::string::npos) {
    return fail("test_malformed_line_does_not_poison_stream", "framing errors should be logged");
  }
  return 0;
}

int test_unroutable_messages_are_dropped() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(server,
                                   R"({"jsonrpc":"2.0","id":{"nested":true},"method":"tools/list"})" "\n"
                                   R"({"jsonrpc":"2.0","id":4,"result":{}})" "\n"
                                   R"({"jsonrpc":"2.0","id":5})" "\n");

  if (session.responses.size() != 1) {
    return fail("test_unroutable_messages_are_dropped", "only the id-bearing request without method is answered");
  }
  if (session.responses[0].at("id") != 5 || session.responses[0].at("error").at("message") != "Unknown method: null") {
    return fail("test_unroutable_messages_are_dropped", "missing method should be reported as unknown");
  }
  return 0;
}

int test_unavailable_engine_fails_tool_calls_in_band() {
  FakeEngine engine;
  engine.engine_state = EngineState::unavailable;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"context_cleanup","arguments":{}}})" "\n");

  if (session.responses.size() != 1 || session.responses[0].at("result").at("isError") != true) {
    return fail("test_unavailable_engine_fails_tool_calls_in_band", "expected an isError result");
  }
  if (engine.cleanup_calls != 0) {
    return fail("test_unavailable_engine_fails_tool_calls_in_band", "unavailable engine must not be invoked");
  }
  const auto message = tool_payload(session.responses[0]).at("message").get<std::string>();
  if (message.find("engine unavailable") == std::string::npos) {
    return fail("test_unavailable_engine_fails_tool_calls_in_band", "failure should mention engine unavailable");
  }
  return 0;
}

int test_argument_validation_failures_are_handler_level() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server,
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"context_search","arguments":{}}})" "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"context_recent_activities","arguments":{"hours":"24"}}})" "\n"
      R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"context_cleanup","arguments":{"dayz":3}}})" "\n"
      R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"context_privacy_blacklist","arguments":{"type":"app","action":"add"}}})" "\n"
      R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"context_stats","arguments":[1]}})" "\n");

  const std::vector<std::string> expected_fragments = {
      "missing required argument: query", "hours must be an integer", "unexpected argument: dayz",
      "missing required argument: value", "arguments must be an object"};
  if (session.responses.size() != expected_fragments.size()) {
    return fail("test_argument_validation_failures_are_handler_level", "expected one response per call");
  }

  for (std::size_t i = 0; i < expected_fragments.size(); ++i) {
    const auto& response = session.responses[i];
    if (response.contains("error") || response.at("result").at("isError") != true) {
      return fail("test_argument_validation_failures_are_handler_level", "argument errors must be isError results");
    }
    const auto message = tool_payload(response).at("message").get<std::string>();
    if (message.find(expected_fragments[i]) == std::string::npos) {
      return fail("test_argument_validation_failures_are_handler_level", "failure message mismatch");
    }
  }

  if (engine.cleanup_calls != 0 || !engine.blacklist_log.empty()) {
    return fail("test_argument_validation_failures_are_handler_level", "engine must not run on invalid arguments");
  }
  return 0;
}

int test_blacklist_unknown_enums_are_error_payloads() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server,
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"context_privacy_blacklist","arguments":{"type":"window","value":"x","action":"purge"}}})" "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"context_privacy_blacklist","arguments":{"type":"app","value":"x","action":"purge"}}})" "\n");

  if (session.responses.size() != 2) {
    return fail("test_blacklist_unknown_enums_are_error_payloads", "expected two responses");
  }

  const std::vector<std::string> expected_messages = {"Unknown type: window. Use 'app' or 'directory'.",
                                                      "Unknown action: purge"};
  for (std::size_t i = 0; i < expected_messages.size(); ++i) {
    const auto& response = session.responses[i];
    if (response.contains("error") || response.at("result").contains("isError")) {
      return fail("test_blacklist_unknown_enums_are_error_payloads", "unknown enum values are not tool failures");
    }
    if (tool_payload(response) != json{{"status", "error"}, {"message", expected_messages[i]}}) {
      return fail("test_blacklist_unknown_enums_are_error_payloads", "error payload mismatch");
    }
  }

  if (!engine.blacklist_log.empty()) {
    return fail("test_blacklist_unknown_enums_are_error_payloads", "engine must not be updated");
  }
  return 0;
}

int test_tool_payloads_round_trip() {
  FakeEngine engine;
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server,
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"context_recent_activities","arguments":{"limit":5}}})" "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"context_privacy_blacklist","arguments":{"type":"directory","value":"/home/me/private","action":"remove"}}})" "\n"
      R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"context_create_context","arguments":{"name":"release","tags":["ship"]}}})" "\n");

  if (session.responses.size() != 3) {
    return fail("test_tool_payloads_round_trip", "expected three responses");
  }
  if (engine.last_recent_hours != 24 || engine.last_recent_limit != 5) {
    return fail("test_tool_payloads_round_trip", "recent activities should merge defaults with arguments");
  }

  const auto recent = tool_payload(session.responses[0]);
  if (recent.at("count") != 1 || recent.at("activities")[0].at("id") != "a1" ||
      recent.at("activities")[0].at("window_title") != "main.cpp") {
    return fail("test_tool_payloads_round_trip", "recent activities payload mismatch");
  }

  const auto blacklist = tool_payload(session.responses[1]);
  if (blacklist.at("message") != "removed directory blacklist entry: /home/me/private" ||
      engine.blacklist_log != std::vector<std::string>{"remove:directory:/home/me/private"}) {
    return fail("test_tool_payloads_round_trip", "blacklist payload mismatch");
  }

  const auto created = tool_payload(session.responses[2]);
  if (created != json{{"status", "success"}, {"context_id", "ctx-9"}, {"name", "release"}}) {
    return fail("test_tool_payloads_round_trip", "create context payload mismatch");
  }

  const json payload{{"status", "success"}, {"nested", {{"values", {1, 2.5, "three"}}, {"flag", true}}}};
  const auto wrapped = context_mcp::mcp::make_tool_result(payload);
  if (json::parse(wrapped.at("content")[0].at("text").get<std::string>()) != payload) {
    return fail("test_tool_payloads_round_trip", "text payload should decode to the same value");
  }
  return 0;
}

int test_invalid_utf8_is_replaced_in_output() {
  FakeEngine engine;
  engine.recent_title = "notes \xff\xfe draft";
  Server server(build_tool_registry(), engine);
  const auto session = run_session(
      server,
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"context_recent_activities","arguments":{}}})" "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");

  if (session.responses.size() != 2 || session.responses[0].at("id") != 1) {
    return fail("test_invalid_utf8_is_replaced_in_output", "bad bytes must not break the response stream");
  }
  if (session.responses[0].at("result").contains("isError")) {
    return fail("test_invalid_utf8_is_replaced_in_output", "bad bytes are not a tool failure");
  }

  const auto title = tool_payload(session.responses[0]).at("activities")[0].at("window_title").get<std::string>();
  if (title != "notes \xEF\xBF\xBD\xEF\xBF\xBD draft") {
    return fail("test_invalid_utf8_is_replaced_in_output", "invalid bytes should become U+FFFD");
  }
  return 0;
}

int test_registry_rejects_duplicate_names() {
  auto registry = build_tool_registry();
  bool threw = false;
  try {
    registry.add(context_mcp::mcp::Tool{.name = "context_stats", .description = "dup"});
  } catch (const std::invalid_argument&) {
    threw = true;
  }

  if (!threw || registry.list().size() != 10) {
    return fail("test_registry_rejects_duplicate_names", "duplicate tool names must be rejected");
  }
  if (registry.resolve("context_stats") == nullptr || registry.resolve("context_stat") != nullptr) {
    return fail("test_registry_rejects_duplicate_names", "resolve should match names exactly");
  }
  return 0;
}

int test_argument_defaults_table() {
  const auto related = context_mcp::mcp::parse_related_args(json{{"activity_id", "a1"}});
  const auto contexts = context_mcp::mcp::parse_list_contexts_args(json::object());
  const auto predict = context_mcp::mcp::parse_predict_args(json{{"activity_description", "x"}, {"max_results", 2}});
  const auto create = context_mcp::mcp::parse_create_context_args(json{{"name", "n"}});

  if (related.max_depth != 2 || contexts.limit != 20 || predict.max_results != 2) {
    return fail("test_argument_defaults_table", "integer defaults mismatch");
  }
  if (!create.description.empty() || !create.tags.empty()) {
    return fail("test_argument_defaults_table", "create context defaults should be empty");
  }

  const std::vector<json> non_positive = {json{{"days", 0}}, json{{"days", -30}}};
  for (const auto& arguments : non_positive) {
    bool threw = false;
    try {
      (void)context_mcp::mcp::parse_cleanup_args(arguments);
    } catch (const std::invalid_argument& ex) {
      threw = std::string(ex.what()) == "days must be a positive integer";
    }
    if (!threw) {
      return fail("test_argument_defaults_table", "non-positive retention should be rejected");
    }
  }

  bool threw = false;
  try {
    (void)context_mcp::mcp::parse_list_contexts_args(json{{"limit", 0}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_argument_defaults_table", "limit=0 should be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_tools_list_returns_fixed_catalog_in_order(); rc != 0) return rc;
  if (int rc = test_tools_list_is_empty_when_engine_unavailable(); rc != 0) return rc;
  if (int rc = test_initialize_succeeds_and_is_idempotent(); rc != 0) return rc;
  if (int rc = test_notifications_are_processed_silently(); rc != 0) return rc;
  if (int rc = test_every_request_gets_one_response_with_its_id(); rc != 0) return rc;
  if (int rc = test_unknown_method_and_tool_are_method_not_found(); rc != 0) return rc;
  if (int rc = test_handler_failure_is_reported_in_band(); rc != 0) return rc;
  if (int rc = test_cleanup_defaults_to_ninety_days(); rc != 0) return rc;
  if (int rc = test_malformed_line_does_not_poison_stream(); rc != 0) return rc;
  if (int rc = test_unroutable_messages_are_dropped(); rc != 0) return rc;
  if (int rc = test_unavailable_engine_fails_tool_calls_in_band(); rc != 0) return rc;
  if (int rc = test_argument_validation_failures_are_handler_level(); rc != 0) return rc;
  if (int rc = test_blacklist_unknown_enums_are_error_payloads(); rc != 0) return rc;
  if (int rc = test_tool_payloads_round_trip(); rc != 0) return rc;
  if (int rc = test_invalid_utf8_is_replaced_in_output(); rc != 0) return rc;
  if (int rc = test_registry_rejects_duplicate_names(); rc != 0) return rc;
  if (int rc = test_argument_defaults_table(); rc != 0) return rc;

  std::cout << "[PASS] mcp unit tests\n";
  return 0;
}
