#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/config.hpp"

struct redisContext;
struct redisReply;

namespace context_mcp::engine {

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const;
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

using ScoredMembers = std::vector<std::pair<std::string, double>>;

// Blocking hiredis connection. Every failure surfaces as EngineError; a
// dropped connection is re-established once per command.
class RedisClient {
 public:
  explicit RedisClient(core::RedisConfig config);
  ~RedisClient();

  RedisClient(const RedisClient&) = delete;
  RedisClient& operator=(const RedisClient&) = delete;
  RedisClient(RedisClient&&) noexcept;
  RedisClient& operator=(RedisClient&&) noexcept;

  void connect();
  [[nodiscard]] bool connected() const;

  RedisReplyPtr command(const std::vector<std::string>& args);

  std::int64_t integer(const std::vector<std::string>& args);
  std::optional<std::string> bulk_string(const std::vector<std::string>& args);
  std::vector<std::string> strings(const std::vector<std::string>& args);
  ScoredMembers scored(const std::vector<std::string>& args);
  std::unordered_map<std::string, std::string> hash(const std::vector<std::string>& args);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  void authenticate();
  void select_db();
  RedisReplyPtr execute(const std::vector<std::string>& args);

  core::RedisConfig config_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace context_mcp::engine
