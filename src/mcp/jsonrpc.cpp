#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace context_mcp::mcp {

namespace {

constexpr int kPayloadIndent = 2;

std::optional<nlohmann::json> parse_id(const nlohmann::json& message) {
  const auto id_it = message.find("id");
  if (id_it == message.end() || id_it->is_null()) {
    return std::nullopt;
  }
  if (id_it->is_string() || id_it->is_number()) {
    return *id_it;
  }
  throw std::invalid_argument("JSON-RPC id must be a string or a number");
}

nlohmann::json text_content(const std::string& text) {
  return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }

  JsonRpcRequest parsed{.method = "null", .params = nlohmann::json::object(), .id = parse_id(message)};

  const auto method_it = message.find("method");
  if (method_it != message.end()) {
    parsed.method = method_it->is_string() ? method_it->get<std::string>() : method_it->dump();
  }

  const auto params_it = message.find("params");
  if (params_it != message.end() && !params_it->is_null()) {
    parsed.params = *params_it;
  }

  return parsed;
}

bool is_client_response(const nlohmann::json& message) {
  return message.is_object() && !message.contains("method") &&
         (message.contains("result") || message.contains("error"));
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

nlohmann::json make_tool_result(const nlohmann::json& payload) {
  const auto text = payload.dump(kPayloadIndent, ' ', false, nlohmann::json::error_handler_t::replace);
  return nlohmann::json{{"content", text_content(text)}};
}

nlohmann::json make_tool_failure(const std::string& message) {
  const nlohmann::json failure{{"status", "error"}, {"message", message}};
  return nlohmann::json{{"content", text_content(serialize(failure))}, {"isError", true}};
}

std::string serialize(const nlohmann::json& message) {
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace context_mcp::mcp
