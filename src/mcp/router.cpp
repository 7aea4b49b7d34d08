#include "mcp/router.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace context_mcp::mcp {

namespace {

std::string tool_name_of(const nlohmann::json& params) {
  if (!params.is_object()) {
    return "null";
  }
  const auto name_it = params.find("name");
  if (name_it == params.end()) {
    return "null";
  }
  return name_it->is_string() ? name_it->get<std::string>() : name_it->dump();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
  if (!params.is_object()) {
    return nlohmann::json::object();
  }
  const auto args_it = params.find("arguments");
  if (args_it == params.end() || args_it->is_null()) {
    return nlohmann::json::object();
  }
  return *args_it;
}

}  // namespace

Router::Router(ToolRegistry tools, engine::EngineFacade& engine) : tools_(std::move(tools)), engine_(engine) {}

nlohmann::json Router::dispatch(const JsonRpcRequest& request, std::ostream& err) {
  const nlohmann::json id = request.id.value_or(nullptr);

  if (request.method == "initialize") {
    return make_result_response(id, handle_initialize());
  }
  if (request.method == "notifications/initialized") {
    state_ = SessionState::serving;
    return make_result_response(id, nlohmann::json::object());
  }
  if (request.method == "tools/list") {
    return make_result_response(id, handle_tools_list());
  }
  if (request.method == "tools/call") {
    return handle_tools_call(id, request.params, err);
  }

  return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "Unknown method: " + request.method});
}

nlohmann::json Router::handle_initialize() {
  state_ = SessionState::initialized;
  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"capabilities", {{"tools", nlohmann::json::object()}}},
                        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

nlohmann::json Router::handle_tools_list() const {
  if (engine_.state() == engine::EngineState::unavailable) {
    return nlohmann::json{{"tools", nlohmann::json::array()}};
  }
  return nlohmann::json{{"tools", tools_.descriptors()}};
}

nlohmann::json Router::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params,
                                         std::ostream& err) {
  const auto name = tool_name_of(params);
  const Tool* tool = tools_.resolve(name);
  if (tool == nullptr) {
    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "Unknown tool: " + name});
  }

  if (engine_.state() == engine::EngineState::unavailable) {
    return make_result_response(id, make_tool_failure("engine unavailable: " + engine_.unavailable_reason()));
  }

  try {
    return make_result_response(id, make_tool_result(tool->handler(engine_, arguments_of(params))));
  } catch (const std::exception& ex) {
    err << "[server] tool " << name << " failed: " << ex.what() << '\n';
    return make_result_response(id, make_tool_failure(ex.what()));
  }
}

}  // namespace context_mcp::mcp
