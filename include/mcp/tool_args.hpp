#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/facade.hpp"
#include "engine/model.hpp"

namespace context_mcp::mcp {

// Typed tools/call arguments with their defaults. Every parse_*_args function
// throws std::invalid_argument naming the offending argument when a required
// key is missing, a value has the wrong type, or an unknown key is present.

struct RecentActivitiesArgs {
  int hours{engine::kDefaultRecentHours};
  int limit{engine::kDefaultRecentLimit};
};

struct SearchArgs {
  std::string query;
  int limit{engine::kDefaultSearchLimit};
};

struct PredictArgs {
  std::string activity_description;
  int max_results{engine::kDefaultPredictMaxResults};
};

struct SuggestionsArgs {
  std::string activity_description;
};

struct RelatedArgs {
  std::string activity_id;
  int max_depth{engine::kDefaultRelatedMaxDepth};
};

struct ListContextsArgs {
  int limit{engine::kDefaultContextListLimit};
};

struct CleanupArgs {
  int days{engine::kDefaultCleanupDays};
};

// type and action stay raw; the tool answers unknown values with a
// status "error" payload rather than a failure.
struct PrivacyBlacklistArgs {
  std::string type;
  std::string value;
  std::string action;
};

struct CreateContextArgs {
  std::string name;
  std::string description;
  std::vector<std::string> tags;
};

RecentActivitiesArgs parse_recent_activities_args(const nlohmann::json& arguments);
SearchArgs parse_search_args(const nlohmann::json& arguments);
PredictArgs parse_predict_args(const nlohmann::json& arguments);
SuggestionsArgs parse_suggestions_args(const nlohmann::json& arguments);
RelatedArgs parse_related_args(const nlohmann::json& arguments);
void parse_stats_args(const nlohmann::json& arguments);
ListContextsArgs parse_list_contexts_args(const nlohmann::json& arguments);
CleanupArgs parse_cleanup_args(const nlohmann::json& arguments);
PrivacyBlacklistArgs parse_privacy_blacklist_args(const nlohmann::json& arguments);
CreateContextArgs parse_create_context_args(const nlohmann::json& arguments);

std::optional<engine::BlacklistKind> parse_blacklist_kind(const std::string& type);
std::optional<engine::BlacklistAction> parse_blacklist_action(const std::string& action);

}  // namespace context_mcp::mcp
