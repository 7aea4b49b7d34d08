#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace context_mcp::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// Drops a trailing "# ..." comment; '#' inside a quoted value is kept.
std::string strip_comment(const std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.empty()) {
    throw std::runtime_error("redis.address must not be empty");
  }

  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    redis.port = 6379;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "engine.enabled") {
    config.engine_enabled = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = db;
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    const auto timeout = std::stoll(value);
    if (timeout <= 0) {
      throw std::runtime_error("redis.connect_timeout_ms must be greater than 0");
    }
    config.redis.connect_timeout_ms = static_cast<std::uint32_t>(timeout);
    return;
  }

  if (key == "search.scan_limit") {
    const auto limit = std::stoll(value);
    if (limit <= 0) {
      throw std::runtime_error("search.scan_limit must be greater than 0");
    }
    config.search.scan_limit = static_cast<std::size_t>(limit);
    return;
  }

  if (key == "prediction.min_confidence") {
    config.prediction.min_confidence = std::stod(value);
    if (config.prediction.min_confidence < 0.0 || config.prediction.min_confidence > 1.0) {
      throw std::runtime_error("prediction.min_confidence must be in range 0..1");
    }
    return;
  }

  if (key == "prediction.window_minutes") {
    config.prediction.window_minutes = std::stoll(value);
    if (config.prediction.window_minutes <= 0) {
      throw std::runtime_error("prediction.window_minutes must be greater than 0");
    }
    return;
  }

  if (key == "graph.decay_factor") {
    config.graph.decay_factor = std::stod(value);
    if (config.graph.decay_factor <= 0.0 || config.graph.decay_factor > 1.0) {
      throw std::runtime_error("graph.decay_factor must be in range (0, 1]");
    }
    return;
  }

  if (key == "graph.max_depth") {
    config.graph.max_depth = std::stoi(value);
    if (config.graph.max_depth <= 0) {
      throw std::runtime_error("graph.max_depth must be greater than 0");
    }
    return;
  }
}

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    line = strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty() && key != "password") {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error("invalid value for " + full_key.str() + ": " + value);
    } catch (const std::out_of_range&) {
      throw std::runtime_error("value out of range for " + full_key.str() + ": " + value);
    }
  }

  return config;
}

void apply_environment_overrides(ServerConfig& config) {
  if (const auto address = getenv_or("CONTEXT_MCP_REDIS_ADDRESS", ""); !address.empty()) {
    apply_redis_address(config.redis, address);
  }
  config.redis.password = getenv_or("CONTEXT_MCP_REDIS_PASSWORD", config.redis.password);
  if (const auto db = getenv_or("CONTEXT_MCP_REDIS_DB", ""); !db.empty()) {
    config.redis.db = std::stoi(db);
    if (config.redis.db < 0) {
      throw std::runtime_error("CONTEXT_MCP_REDIS_DB must be greater than or equal to 0");
    }
  }
  config.redis.key_prefix = getenv_or("CONTEXT_MCP_REDIS_PREFIX", config.redis.key_prefix);
  if (config.redis.key_prefix.empty()) {
    throw std::runtime_error("CONTEXT_MCP_REDIS_PREFIX must not be empty");
  }
}

std::string describe_redis_address(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

}  // namespace context_mcp::core
