#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/facade.hpp"
#include "mcp/router.hpp"
#include "mcp/tools.hpp"

namespace context_mcp::mcp {

// Newline-delimited JSON-RPC over a pair of streams. One request is fully
// answered before the next line is read; diagnostics go to the error stream.
class Server {
 public:
  Server(ToolRegistry tools, engine::EngineFacade& engine);

  int run(std::istream& in, std::ostream& out, std::ostream& err);

  [[nodiscard]] const Router& router() const noexcept { return router_; }

 private:
  std::optional<nlohmann::json> handle_line(const std::string& line, std::ostream& err);

  Router router_;
};

}  // namespace context_mcp::mcp
