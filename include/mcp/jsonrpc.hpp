#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace context_mcp::mcp {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr int kMethodNotFound = -32601;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  // Non-string methods are kept as their JSON text ("null" when absent).
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// Throws std::invalid_argument when the message is not an object or carries
// an id that is neither a string nor a number. A null id counts as absent.
JsonRpcRequest parse_request(const nlohmann::json& message);

// True for replies sent by the client (no method, result or error present).
bool is_client_response(const nlohmann::json& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

// tools/call result carrying the payload as a single text block.
nlohmann::json make_tool_result(const nlohmann::json& payload);

// tools/call result for a tool that ran and failed; flagged with isError.
nlohmann::json make_tool_failure(const std::string& message);

// One-line encoding; invalid UTF-8 is replaced rather than thrown on.
std::string serialize(const nlohmann::json& message);

}  // namespace context_mcp::mcp
