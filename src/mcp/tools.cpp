#include "mcp/tools.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcp/tool_args.hpp"

namespace context_mcp::mcp {

namespace {

using engine::EngineFacade;

nlohmann::json integer_property(const char* description, const int fallback) {
  return nlohmann::json{{"type", "integer"}, {"description", description}, {"default", fallback}};
}

nlohmann::json string_property(const char* description) {
  return nlohmann::json{{"type", "string"}, {"description", description}};
}

nlohmann::json object_schema(nlohmann::json properties, nlohmann::json required = nlohmann::json::array()) {
  nlohmann::json schema{{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty()) {
    schema["required"] = std::move(required);
  }
  return schema;
}

nlohmann::json activity_json(const engine::Activity& activity) {
  return nlohmann::json{{"id", activity.id},
                        {"timestamp", activity.timestamp_ms},
                        {"app_name", activity.app_name},
                        {"window_title", activity.window_title},
                        {"file_path", activity.file_path},
                        {"context_id", activity.context_id}};
}

nlohmann::json privacy_json(const engine::PrivacyStats& privacy) {
  return nlohmann::json{{"blacklisted_apps", privacy.blacklisted_apps},
                        {"blacklisted_directories", privacy.blacklisted_directories},
                        {"blacklisted_app_count", privacy.blacklisted_apps.size()},
                        {"blacklisted_directory_count", privacy.blacklisted_directories.size()}};
}

nlohmann::json context_json(const engine::WorkContext& context) {
  return nlohmann::json{{"id", context.id},
                        {"name", context.name},
                        {"description", context.description},
                        {"tags", context.tags},
                        {"created_at", context.created_at_ms},
                        {"last_active", context.last_active_ms}};
}

nlohmann::json handle_recent_activities(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_recent_activities_args(arguments);
  nlohmann::json activities = nlohmann::json::array();
  for (const auto& activity : engine.recent_activities(args.hours, args.limit)) {
    activities.push_back(activity_json(activity));
  }
  return nlohmann::json{{"status", "success"}, {"count", activities.size()}, {"activities", activities}};
}

nlohmann::json handle_search(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_search_args(arguments);
  nlohmann::json results = nlohmann::json::array();
  for (const auto& result : engine.search(args.query, args.limit)) {
    auto item = activity_json(result.activity);
    item["score"] = result.score;
    results.push_back(std::move(item));
  }
  return nlohmann::json{{"status", "success"}, {"count", results.size()}, {"results", results}};
}

nlohmann::json handle_predict(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_predict_args(arguments);
  nlohmann::json predictions = nlohmann::json::array();
  for (const auto& prediction : engine.predict(args.activity_description, args.max_results)) {
    auto item = activity_json(prediction.activity);
    item["confidence"] = prediction.confidence;
    item["reason"] = prediction.reason;
    predictions.push_back(std::move(item));
  }
  return nlohmann::json{{"status", "success"}, {"count", predictions.size()}, {"predictions", predictions}};
}

nlohmann::json handle_suggestions(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_suggestions_args(arguments);
  const auto suggestions = engine.suggestions(args.activity_description);
  return nlohmann::json{{"status", "success"},
                        {"suggestions",
                         {{"related_files", suggestions.related_files},
                          {"related_apps", suggestions.related_apps},
                          {"next_actions", suggestions.next_actions},
                          {"confidence", suggestions.confidence}}}};
}

nlohmann::json handle_related(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_related_args(arguments);
  nlohmann::json related = nlohmann::json::array();
  for (const auto& entry : engine.related(args.activity_id, args.max_depth)) {
    auto item = activity_json(entry.activity);
    item["depth"] = entry.depth;
    item["weight"] = entry.weight;
    related.push_back(std::move(item));
  }
  return nlohmann::json{{"status", "success"}, {"count", related.size()}, {"related", related}};
}

nlohmann::json handle_stats(EngineFacade& engine, const nlohmann::json& arguments) {
  parse_stats_args(arguments);
  const auto stats = engine.stats();
  return nlohmann::json{{"status", "success"},
                        {"stats",
                         {{"database",
                           {{"activities", stats.activity_count},
                            {"contexts", stats.context_count},
                            {"oldest_activity", stats.oldest_activity_ms},
                            {"newest_activity", stats.newest_activity_ms}}},
                          {"search", {{"scan_limit", stats.search_scan_limit}}},
                          {"graph", {{"nodes", stats.graph_nodes}, {"edges", stats.graph_edges}}},
                          {"privacy", privacy_json(stats.privacy)}}}};
}

nlohmann::json handle_list_contexts(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_list_contexts_args(arguments);
  nlohmann::json contexts = nlohmann::json::array();
  for (const auto& context : engine.list_contexts(args.limit)) {
    contexts.push_back(context_json(context));
  }
  return nlohmann::json{{"status", "success"}, {"count", contexts.size()}, {"contexts", contexts}};
}

nlohmann::json handle_cleanup(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_cleanup_args(arguments);
  const auto deleted = engine.cleanup(args.days);
  return nlohmann::json{{"status", "success"}, {"deleted_records", deleted}, {"retention_days", args.days}};
}

nlohmann::json handle_privacy_blacklist(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_privacy_blacklist_args(arguments);

  const auto kind = parse_blacklist_kind(args.type);
  if (!kind.has_value()) {
    return nlohmann::json{{"status", "error"}, {"message", "Unknown type: " + args.type + ". Use 'app' or 'directory'."}};
  }
  const auto action = parse_blacklist_action(args.action);
  if (!action.has_value()) {
    return nlohmann::json{{"status", "error"}, {"message", "Unknown action: " + args.action}};
  }

  const auto privacy = engine.update_blacklist(*kind, args.value, *action);
  const std::string verb = *action == engine::BlacklistAction::add ? "added" : "removed";
  return nlohmann::json{{"status", "success"},
                        {"message", verb + " " + args.type + " blacklist entry: " + args.value},
                        {"current_stats", privacy_json(privacy)}};
}

nlohmann::json handle_create_context(EngineFacade& engine, const nlohmann::json& arguments) {
  const auto args = parse_create_context_args(arguments);
  const auto context_id = engine.create_context(args.name, args.description, args.tags);
  return nlohmann::json{{"status", "success"}, {"context_id", context_id}, {"name", args.name}};
}

}  // namespace

void ToolRegistry::add(Tool tool) {
  if (index_.count(tool.name) != 0) {
    throw std::invalid_argument("duplicate tool name: " + tool.name);
  }
  index_.emplace(tool.name, tools_.size());
  tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::resolve(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tools_[it->second];
}

nlohmann::json ToolRegistry::descriptors() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return tools;
}

ToolRegistry build_tool_registry() {
  ToolRegistry registry;

  registry.add(Tool{
      .name = "context_recent_activities",
      .description = "Get recent tracked activities from the Context Continuity Engine",
      .input_schema = object_schema(
          {{"hours", integer_property("Look back this many hours (default 24)", engine::kDefaultRecentHours)},
           {"limit", integer_property("Max activities to return (default 50)", engine::kDefaultRecentLimit)}}),
      .handler = handle_recent_activities});

  registry.add(Tool{
      .name = "context_search",
      .description = "Semantic search across tracked activities using embeddings",
      .input_schema =
          object_schema({{"query", string_property("Search query text")},
                         {"limit", integer_property("Max results (default 10)", engine::kDefaultSearchLimit)}},
                        {"query"}),
      .handler = handle_search});

  registry.add(Tool{
      .name = "context_predict",
      .description = "Predict relevant context for an activity description",
      .input_schema = object_schema(
          {{"activity_description", string_property("Description of the current activity")},
           {"max_results", integer_property("Max predictions (default 5)", engine::kDefaultPredictMaxResults)}},
          {"activity_description"}),
      .handler = handle_predict});

  registry.add(Tool{.name = "context_suggestions",
                    .description = "Get actionable context suggestions (related files, apps, next actions)",
                    .input_schema = object_schema(
                        {{"activity_description", string_property("Description of the current activity")}},
                        {"activity_description"}),
                    .handler = handle_suggestions});

  registry.add(Tool{
      .name = "context_related",
      .description = "Get activities related to a given activity via the temporal graph",
      .input_schema = object_schema(
          {{"activity_id", string_property("Activity ID to find relations for")},
           {"max_depth", integer_property("Max graph depth (default 2)", engine::kDefaultRelatedMaxDepth)}},
          {"activity_id"}),
      .handler = handle_related});

  registry.add(Tool{.name = "context_stats",
                    .description = "Get statistics from all Context Continuity Engine components",
                    .input_schema = object_schema(nlohmann::json::object()),
                    .handler = handle_stats});

  registry.add(Tool{
      .name = "context_list_contexts",
      .description = "List tracked work contexts ordered by last active",
      .input_schema = object_schema(
          {{"limit", integer_property("Max contexts to return (default 20)", engine::kDefaultContextListLimit)}}),
      .handler = handle_list_contexts});

  registry.add(Tool{
      .name = "context_cleanup",
      .description = "Remove activity data older than N days",
      .input_schema = object_schema(
          {{"days", integer_property("Retain data for this many days (default 90)", engine::kDefaultCleanupDays)}}),
      .handler = handle_cleanup});

  registry.add(Tool{
      .name = "context_privacy_blacklist",
      .description = "Add or remove privacy blacklist entries for apps or directories",
      .input_schema = object_schema(
          {{"type",
            {{"type", "string"}, {"enum", {"app", "directory"}}, {"description", "Type of blacklist entry"}}},
           {"value", string_property("App name or directory path")},
           {"action", {{"type", "string"}, {"enum", {"add", "remove"}}, {"description", "Add or remove the entry"}}}},
          {"type", "value", "action"}),
      .handler = handle_privacy_blacklist});

  registry.add(Tool{
      .name = "context_create_context",
      .description = "Create or update a named work context",
      .input_schema = object_schema(
          {{"name", string_property("Context name")},
           {"description", string_property("Context description")},
           {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "Tags for the context"}}}},
          {"name"}),
      .handler = handle_create_context});

  return registry;
}

}  // namespace context_mcp::mcp
