#pragma once

#include <iosfwd>

#include <nlohmann/json.hpp>

#include "engine/facade.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace context_mcp::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "context-continuity";
constexpr const char* kServerVersion = "1.0.0";

enum class SessionState { uninitialized, initialized, serving };

// Maps protocol methods to behavior. Always yields exactly one envelope; the
// stdio loop decides whether it is written. Tool failures are logged to err.
class Router {
 public:
  Router(ToolRegistry tools, engine::EngineFacade& engine);

  nlohmann::json dispatch(const JsonRpcRequest& request, std::ostream& err);

  [[nodiscard]] SessionState state() const noexcept { return state_; }

 private:
  nlohmann::json handle_initialize();
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params, std::ostream& err);

  ToolRegistry tools_;
  engine::EngineFacade& engine_;
  SessionState state_{SessionState::uninitialized};
};

}  // namespace context_mcp::mcp
