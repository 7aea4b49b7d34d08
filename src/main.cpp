#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "engine/facade.hpp"
#include "mcp/router.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"

namespace {

std::string format_config_settings(const context_mcp::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[config] loaded " << config_path << " | engine_enabled=" << (config.engine_enabled ? "true" : "false")
         << " | redis_address=" << context_mcp::core::describe_redis_address(config.redis)
         << " | key_prefix=" << config.redis.key_prefix << " | scan_limit=" << config.search.scan_limit
         << " | min_confidence=" << config.prediction.min_confidence
         << " | decay_factor=" << config.graph.decay_factor;
  return output.str();
}

std::string resolve_config_path(int argc, char** argv, bool& explicit_path) {
  if (argc > 1) {
    explicit_path = true;
    return argv[1];
  }
  if (const auto* env_path = std::getenv("CONTEXT_MCP_CONFIG"); env_path != nullptr && *env_path != '\0') {
    explicit_path = true;
    return env_path;
  }
  explicit_path = false;
  return context_mcp::core::kDefaultConfigPath;
}

}  // namespace

int main(int argc, char** argv) {
  std::cerr << "Context Continuity MCP Server v" << context_mcp::mcp::kServerVersion << '\n';

  bool explicit_path = false;
  const std::string config_path = resolve_config_path(argc, argv, explicit_path);

  std::unique_ptr<context_mcp::engine::EngineFacade> engine;
  try {
    context_mcp::core::ServerConfig config{};
    if (explicit_path || std::filesystem::exists(config_path)) {
      config = context_mcp::core::load_server_config(config_path);
      std::cerr << format_config_settings(config, config_path) << '\n';
    } else {
      std::cerr << "[config] " << config_path << " not found; using built-in defaults\n";
    }
    context_mcp::core::apply_environment_overrides(config);
    engine = context_mcp::engine::open_engine(config);
  } catch (const std::exception& ex) {
    std::cerr << "[config] error: " << ex.what() << '\n';
    engine = context_mcp::engine::make_unavailable_engine(std::string("configuration error: ") + ex.what());
  }

  if (engine->state() == context_mcp::engine::EngineState::ready) {
    std::cerr << "Engine: available\n";
  } else {
    std::cerr << "Engine: unavailable (" << engine->unavailable_reason() << ")\n";
  }

  context_mcp::mcp::Server server(context_mcp::mcp::build_tool_registry(), *engine);
  return server.run(std::cin, std::cout, std::cerr);
}
