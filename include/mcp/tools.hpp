#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/facade.hpp"

namespace context_mcp::mcp {

// Runs one tool against the engine and returns its success payload. Throws on
// any argument or engine failure.
using ToolHandler = std::function<nlohmann::json(engine::EngineFacade& engine, const nlohmann::json& arguments)>;

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  ToolHandler handler;
};

// Insertion-ordered catalog with exact, case-sensitive name lookup.
class ToolRegistry {
 public:
  // Throws std::invalid_argument on a duplicate name.
  void add(Tool tool);

  [[nodiscard]] const std::vector<Tool>& list() const noexcept { return tools_; }
  [[nodiscard]] const Tool* resolve(const std::string& name) const;

  // tools/list descriptors: name, description and inputSchema in catalog order.
  [[nodiscard]] nlohmann::json descriptors() const;

 private:
  std::vector<Tool> tools_;
  std::unordered_map<std::string, std::size_t> index_;
};

ToolRegistry build_tool_registry();

}  // namespace context_mcp::mcp
