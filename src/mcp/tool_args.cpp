#include "mcp/tool_args.hpp"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace context_mcp::mcp {
namespace {

class ArgumentReader {
 public:
  ArgumentReader(const nlohmann::json& arguments, std::initializer_list<std::string_view> known)
      : arguments_(arguments) {
    if (!arguments_.is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    for (const auto& item : arguments_.items()) {
      const auto& name = item.key();
      bool recognized = false;
      for (const auto candidate : known) {
        recognized = recognized || candidate == name;
      }
      if (!recognized) {
        throw std::invalid_argument("unexpected argument: " + name);
      }
    }
  }

  [[nodiscard]] int positive_integer(const char* name, const int fallback) const {
    const auto it = arguments_.find(name);
    if (it == arguments_.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_number_integer()) {
      throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    const auto value = it->get<std::int64_t>();
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
      throw std::invalid_argument(std::string(name) + " must be a positive integer");
    }
    return static_cast<int>(value);
  }

  [[nodiscard]] std::string required_string(const char* name) const {
    const auto it = arguments_.find(name);
    if (it == arguments_.end() || it->is_null()) {
      throw std::invalid_argument("missing required argument: " + std::string(name));
    }
    if (!it->is_string()) {
      throw std::invalid_argument(std::string(name) + " must be a string");
    }
    return it->get<std::string>();
  }

  [[nodiscard]] std::string optional_string(const char* name, std::string fallback) const {
    const auto it = arguments_.find(name);
    if (it == arguments_.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_string()) {
      throw std::invalid_argument(std::string(name) + " must be a string");
    }
    return it->get<std::string>();
  }

  [[nodiscard]] std::vector<std::string> string_list(const char* name) const {
    const auto it = arguments_.find(name);
    if (it == arguments_.end() || it->is_null()) {
      return {};
    }
    if (!it->is_array()) {
      throw std::invalid_argument(std::string(name) + " must be an array of strings");
    }

    std::vector<std::string> values;
    values.reserve(it->size());
    for (const auto& value : *it) {
      if (!value.is_string()) {
        throw std::invalid_argument(std::string(name) + " must be an array of strings");
      }
      values.push_back(value.get<std::string>());
    }
    return values;
  }

 private:
  const nlohmann::json& arguments_;
};

}  // namespace

RecentActivitiesArgs parse_recent_activities_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"hours", "limit"});
  RecentActivitiesArgs args{};
  args.hours = reader.positive_integer("hours", args.hours);
  args.limit = reader.positive_integer("limit", args.limit);
  return args;
}

SearchArgs parse_search_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"query", "limit"});
  SearchArgs args{};
  args.query = reader.required_string("query");
  args.limit = reader.positive_integer("limit", args.limit);
  return args;
}

PredictArgs parse_predict_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"activity_description", "max_results"});
  PredictArgs args{};
  args.activity_description = reader.required_string("activity_description");
  args.max_results = reader.positive_integer("max_results", args.max_results);
  return args;
}

SuggestionsArgs parse_suggestions_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"activity_description"});
  return SuggestionsArgs{.activity_description = reader.required_string("activity_description")};
}

RelatedArgs parse_related_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"activity_id", "max_depth"});
  RelatedArgs args{};
  args.activity_id = reader.required_string("activity_id");
  args.max_depth = reader.positive_integer("max_depth", args.max_depth);
  return args;
}

void parse_stats_args(const nlohmann::json& arguments) { const ArgumentReader reader(arguments, {}); }

ListContextsArgs parse_list_contexts_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"limit"});
  ListContextsArgs args{};
  args.limit = reader.positive_integer("limit", args.limit);
  return args;
}

CleanupArgs parse_cleanup_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"days"});
  CleanupArgs args{};
  args.days = reader.positive_integer("days", args.days);
  return args;
}

PrivacyBlacklistArgs parse_privacy_blacklist_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"type", "value", "action"});
  PrivacyBlacklistArgs args{};
  args.type = reader.required_string("type");
  args.value = reader.required_string("value");
  args.action = reader.required_string("action");
  return args;
}

std::optional<engine::BlacklistKind> parse_blacklist_kind(const std::string& type) {
  if (type == "app") {
    return engine::BlacklistKind::app;
  }
  if (type == "directory") {
    return engine::BlacklistKind::directory;
  }
  return std::nullopt;
}

std::optional<engine::BlacklistAction> parse_blacklist_action(const std::string& action) {
  if (action == "add") {
    return engine::BlacklistAction::add;
  }
  if (action == "remove") {
    return engine::BlacklistAction::remove;
  }
  return std::nullopt;
}

CreateContextArgs parse_create_context_args(const nlohmann::json& arguments) {
  const ArgumentReader reader(arguments, {"name", "description", "tags"});
  CreateContextArgs args{};
  args.name = reader.required_string("name");
  args.description = reader.optional_string("description", "");
  args.tags = reader.string_list("tags");
  return args;
}

}  // namespace context_mcp::mcp
