#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace context_mcp::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"ctx"};
  std::uint32_t connect_timeout_ms{1000};
};

struct SearchConfig {
  std::size_t scan_limit{1000};
};

struct PredictionConfig {
  double min_confidence{0.1};
  std::int64_t window_minutes{30};
};

struct GraphConfig {
  double decay_factor{0.5};
  int max_depth{5};
};

struct ServerConfig {
  bool engine_enabled{true};
  RedisConfig redis{};
  SearchConfig search{};
  PredictionConfig prediction{};
  GraphConfig graph{};
};

constexpr const char* kDefaultConfigPath = "configs/context-mcp.yaml";

// Throws std::runtime_error when the file cannot be opened or a value is invalid.
ServerConfig load_server_config(const std::string& path);

// Applies CONTEXT_MCP_REDIS_* environment overrides on top of a loaded config.
void apply_environment_overrides(ServerConfig& config);

std::string describe_redis_address(const RedisConfig& redis);

}  // namespace context_mcp::core
