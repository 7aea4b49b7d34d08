#include "engine/redis_client.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "engine/facade.hpp"

namespace context_mcp::engine {
namespace {

std::string reply_text(const redisReply* reply) {
  if (reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, static_cast<std::size_t>(reply->len));
}

bool is_text(const redisReply* reply) {
  return reply != nullptr && (reply->type == REDIS_REPLY_STRING || reply->type == REDIS_REPLY_STATUS);
}

void expect_array(const redisReply* reply, const std::string& command) {
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw EngineError("unexpected reply type from " + command);
  }
}

}  // namespace

void RedisReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

void RedisClient::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

RedisClient::RedisClient(core::RedisConfig config) : config_(std::move(config)) {}

RedisClient::~RedisClient() = default;

RedisClient::RedisClient(RedisClient&&) noexcept = default;
RedisClient& RedisClient::operator=(RedisClient&&) noexcept = default;

bool RedisClient::connected() const { return context_ != nullptr && context_->err == REDIS_OK; }

void RedisClient::connect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(config_.connect_timeout_ms / 1000U);
  timeout.tv_usec = static_cast<suseconds_t>((config_.connect_timeout_ms % 1000U) * 1000U);

  redisContext* raw = nullptr;
  if (!config_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(config_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(config_.host.c_str(), static_cast<int>(config_.port), timeout);
  }

  if (raw == nullptr) {
    throw EngineError("redis connection failed: out of memory");
  }
  context_.reset(raw);

  if (context_->err != REDIS_OK) {
    const std::string message = context_->errstr;
    context_.reset();
    throw EngineError("redis connection failed: " + message);
  }

  authenticate();
  select_db();
}

void RedisClient::authenticate() {
  if (config_.password.empty()) {
    return;
  }

  const auto reply = execute({"AUTH", config_.password});
  if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[redis] AUTH rejected\n";
    context_.reset();
    throw EngineError("redis AUTH failed");
  }
}

void RedisClient::select_db() {
  if (config_.db == 0) {
    return;
  }

  const auto reply = execute({"SELECT", std::to_string(config_.db)});
  if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
    context_.reset();
    throw EngineError("redis SELECT failed");
  }
}

RedisReplyPtr RedisClient::execute(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  auto* raw = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  return RedisReplyPtr(raw);
}

RedisReplyPtr RedisClient::command(const std::vector<std::string>& args) {
  if (args.empty()) {
    throw EngineError("redis command must not be empty");
  }

  if (!connected()) {
    connect();
  }

  auto reply = execute(args);
  if (reply == nullptr) {
    std::cerr << "[redis] " << args.front() << " failed; reconnecting\n";
    connect();
    reply = execute(args);
  }

  if (reply == nullptr) {
    throw EngineError("redis command failed: " + args.front());
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw EngineError(args.front() + " failed: " + reply_text(reply.get()));
  }
  return reply;
}

std::int64_t RedisClient::integer(const std::vector<std::string>& args) {
  const auto reply = command(args);
  if (reply->type == REDIS_REPLY_INTEGER) {
    return static_cast<std::int64_t>(reply->integer);
  }
  if (reply->type == REDIS_REPLY_STRING) {
    return std::stoll(reply_text(reply.get()));
  }
  throw EngineError("unexpected reply type from " + args.front());
}

std::optional<std::string> RedisClient::bulk_string(const std::vector<std::string>& args) {
  const auto reply = command(args);
  if (reply->type == REDIS_REPLY_NIL) {
    return std::nullopt;
  }
  if (!is_text(reply.get())) {
    throw EngineError("unexpected reply type from " + args.front());
  }
  return reply_text(reply.get());
}

std::vector<std::string> RedisClient::strings(const std::vector<std::string>& args) {
  const auto reply = command(args);
  expect_array(reply.get(), args.front());

  std::vector<std::string> values;
  values.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const auto* element = reply->element[i];
    if (is_text(element)) {
      values.push_back(reply_text(element));
    }
  }
  return values;
}

ScoredMembers RedisClient::scored(const std::vector<std::string>& args) {
  const auto reply = command(args);
  expect_array(reply.get(), args.front());

  ScoredMembers members;
  members.reserve(reply->elements / 2);
  for (std::size_t i = 0; i + 1 < reply->elements; i += 2) {
    const auto* member = reply->element[i];
    const auto* score = reply->element[i + 1];
    if (!is_text(member) || !is_text(score)) {
      continue;
    }
    members.emplace_back(reply_text(member), std::stod(reply_text(score)));
  }
  return members;
}

std::unordered_map<std::string, std::string> RedisClient::hash(const std::vector<std::string>& args) {
  const auto reply = command(args);
  expect_array(reply.get(), args.front());

  std::unordered_map<std::string, std::string> fields;
  for (std::size_t i = 0; i + 1 < reply->elements; i += 2) {
    const auto* field = reply->element[i];
    const auto* value = reply->element[i + 1];
    if (is_text(field) && is_text(value)) {
      fields.emplace(reply_text(field), reply_text(value));
    }
  }
  return fields;
}

}  // namespace context_mcp::engine
