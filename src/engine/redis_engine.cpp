#include "engine/redis_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"
#include "engine/text_match.hpp"

namespace context_mcp::engine {
namespace {

constexpr std::size_t kPredictionSeedHits = 10;
constexpr std::size_t kSuccessorsPerHit = 5;
constexpr int kSuggestionPredictions = 10;
constexpr std::size_t kSuggestedFileActions = 3;
constexpr std::size_t kSuggestedAppActions = 2;
constexpr const char* kScanBatch = "500";

std::int64_t parse_int64(const std::string& value, const std::int64_t fallback) {
  try {
    return value.empty() ? fallback : std::stoll(value);
  } catch (const std::exception&) {
    return fallback;
  }
}

std::string field_or_empty(const std::unordered_map<std::string, std::string>& fields, const std::string& name) {
  const auto it = fields.find(name);
  return it == fields.end() ? std::string{} : it->second;
}

std::vector<std::string> parse_tags(const std::string& encoded) {
  std::vector<std::string> tags;
  const auto parsed = nlohmann::json::parse(encoded, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return tags;
  }
  for (const auto& tag : parsed) {
    if (tag.is_string()) {
      tags.push_back(tag.get<std::string>());
    }
  }
  return tags;
}

template <typename T, typename Score>
void sort_and_truncate(std::vector<T>& items, const std::size_t limit, Score score) {
  std::stable_sort(items.begin(), items.end(), [&score](const T& lhs, const T& rhs) {
    if (score(lhs) != score(rhs)) {
      return score(lhs) > score(rhs);
    }
    return lhs.activity.timestamp_ms > rhs.activity.timestamp_ms;
  });
  if (items.size() > limit) {
    items.resize(limit);
  }
}

void append_unique(std::vector<std::string>& values, const std::string& value) {
  if (!value.empty() && std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

}  // namespace

bool RedisEngine::PrivacyFilter::blocks(const Activity& activity) const {
  if (apps.count(activity.app_name) != 0) {
    return true;
  }
  return std::any_of(directories.begin(), directories.end(), [&activity](const std::string& directory) {
    return path_is_under(activity.file_path, directory);
  });
}

RedisEngine::RedisEngine(core::ServerConfig config) : config_(std::move(config)), redis_(config_.redis) {}

void RedisEngine::check_connectivity() {
  redis_.connect();
  const auto pong = redis_.bulk_string({"PING"});
  if (!pong.has_value() || *pong != "PONG") {
    throw EngineError("unexpected PING reply from redis");
  }
}

std::string RedisEngine::key(const std::string& suffix) const { return config_.redis.key_prefix + ":" + suffix; }

std::string RedisEngine::activity_key(const std::string& id) const { return key("activity:" + id); }

std::string RedisEngine::graph_key(const std::string& id) const { return key("graph:" + id); }

std::string RedisEngine::context_key(const std::string& id) const { return key("context:" + id); }

std::optional<Activity> RedisEngine::load_activity(const std::string& id) {
  const auto fields = redis_.hash({"HGETALL", activity_key(id)});
  if (fields.empty()) {
    return std::nullopt;
  }

  Activity activity{};
  activity.id = id;
  activity.timestamp_ms = parse_int64(field_or_empty(fields, "timestamp"), 0);
  activity.app_name = field_or_empty(fields, "app_name");
  activity.window_title = field_or_empty(fields, "window_title");
  activity.file_path = field_or_empty(fields, "file_path");
  activity.context_id = field_or_empty(fields, "context_id");
  return activity;
}

std::vector<Activity> RedisEngine::load_visible(const std::vector<std::string>& ids, const PrivacyFilter& filter) {
  std::vector<Activity> activities;
  activities.reserve(ids.size());
  for (const auto& id : ids) {
    auto activity = load_activity(id);
    if (activity.has_value() && !filter.blocks(*activity)) {
      activities.push_back(std::move(*activity));
    }
  }
  return activities;
}

ScoredMembers RedisEngine::neighbours(const std::string& id) {
  return redis_.scored({"ZREVRANGE", graph_key(id), "0", "-1", "WITHSCORES"});
}

RedisEngine::PrivacyFilter RedisEngine::load_privacy_filter() {
  PrivacyFilter filter{};
  for (auto& app : redis_.strings({"SMEMBERS", key("privacy:apps")})) {
    filter.apps.insert(std::move(app));
  }
  filter.directories = redis_.strings({"SMEMBERS", key("privacy:directories")});
  return filter;
}

PrivacyStats RedisEngine::privacy_stats() {
  PrivacyStats stats{};
  stats.blacklisted_apps = redis_.strings({"SMEMBERS", key("privacy:apps")});
  stats.blacklisted_directories = redis_.strings({"SMEMBERS", key("privacy:directories")});
  std::sort(stats.blacklisted_apps.begin(), stats.blacklisted_apps.end());
  std::sort(stats.blacklisted_directories.begin(), stats.blacklisted_directories.end());
  return stats;
}

std::vector<Activity> RedisEngine::recent_activities(const int hours, const int limit) {
  const auto filter = load_privacy_filter();
  const auto since_ms = core::unix_timestamp_now_ms() - core::hours_to_ms(hours);
  const auto wanted = static_cast<std::size_t>(limit);
  const auto batch = std::max<std::size_t>(wanted, 64);

  std::vector<Activity> activities;
  for (std::size_t offset = 0; activities.size() < wanted; offset += batch) {
    const auto ids = redis_.strings({"ZREVRANGEBYSCORE", key("activities"), "+inf", std::to_string(since_ms), "LIMIT",
                                     std::to_string(offset), std::to_string(batch)});
    for (auto& activity : load_visible(ids, filter)) {
      if (activities.size() == wanted) {
        break;
      }
      activities.push_back(std::move(activity));
    }
    if (ids.size() < batch) {
      break;
    }
  }
  return activities;
}

std::vector<SearchResult> RedisEngine::score_candidates(const std::string& text, const PrivacyFilter& filter) {
  const auto query = tokenize(text);
  if (query.empty()) {
    return {};
  }

  const auto ids = redis_.strings(
      {"ZREVRANGE", key("activities"), "0", std::to_string(static_cast<long long>(config_.search.scan_limit) - 1)});

  std::vector<SearchResult> results;
  for (auto& activity : load_visible(ids, filter)) {
    const double score = similarity(query, activity_tokens(activity));
    if (score > 0.0) {
      results.push_back(SearchResult{std::move(activity), score});
    }
  }
  return results;
}

std::vector<SearchResult> RedisEngine::search(const std::string& query, const int limit) {
  auto results = score_candidates(query, load_privacy_filter());
  sort_and_truncate(results, static_cast<std::size_t>(limit), [](const SearchResult& result) { return result.score; });
  return results;
}

std::vector<Prediction> RedisEngine::predict(const std::string& activity_description, const int max_results) {
  const auto filter = load_privacy_filter();
  auto hits = score_candidates(activity_description, filter);
  sort_and_truncate(hits, kPredictionSeedHits, [](const SearchResult& result) { return result.score; });

  std::unordered_map<std::string, Prediction> best;
  const auto consider = [&](const Activity& activity, const double confidence, std::string reason) {
    if (confidence < config_.prediction.min_confidence) {
      return;
    }
    const auto it = best.find(activity.id);
    if (it == best.end() || it->second.confidence < confidence) {
      best[activity.id] = Prediction{activity, confidence, std::move(reason)};
    }
  };

  const auto window_ms = core::minutes_to_ms(config_.prediction.window_minutes);
  for (const auto& hit : hits) {
    consider(hit.activity, hit.score, "similar to current activity");

    const auto edges = neighbours(hit.activity.id);
    const double max_weight = edges.empty() ? 0.0 : edges.front().second;
    for (const auto& [neighbour_id, weight] : edges) {
      if (max_weight <= 0.0) {
        break;
      }
      const auto neighbour = load_activity(neighbour_id);
      if (neighbour.has_value() && !filter.blocks(*neighbour)) {
        consider(*neighbour, hit.score * (weight / max_weight), "linked to '" + hit.activity.window_title + "'");
      }
    }

    const auto successor_ids = redis_.strings({"ZRANGEBYSCORE", key("activities"),
                                               "(" + std::to_string(hit.activity.timestamp_ms),
                                               std::to_string(hit.activity.timestamp_ms + window_ms), "LIMIT", "0",
                                               std::to_string(kSuccessorsPerHit)});
    for (const auto& successor : load_visible(successor_ids, filter)) {
      const auto gap_ms = static_cast<double>(successor.timestamp_ms - hit.activity.timestamp_ms);
      const double proximity = std::clamp(1.0 - (gap_ms / static_cast<double>(window_ms)), 0.0, 1.0);
      consider(successor, hit.score * proximity, "followed '" + hit.activity.window_title + "'");
    }
  }

  std::vector<Prediction> predictions;
  predictions.reserve(best.size());
  for (auto& [_, prediction] : best) {
    predictions.push_back(std::move(prediction));
  }
  sort_and_truncate(predictions, static_cast<std::size_t>(max_results),
                    [](const Prediction& prediction) { return prediction.confidence; });
  return predictions;
}

ContextSuggestions RedisEngine::suggestions(const std::string& activity_description) {
  const auto predictions = predict(activity_description, kSuggestionPredictions);

  ContextSuggestions suggestions{};
  for (const auto& prediction : predictions) {
    append_unique(suggestions.related_files, prediction.activity.file_path);
    append_unique(suggestions.related_apps, prediction.activity.app_name);
  }

  for (std::size_t i = 0; i < suggestions.related_files.size() && i < kSuggestedFileActions; ++i) {
    suggestions.next_actions.push_back("Open " + suggestions.related_files[i]);
  }
  for (std::size_t i = 0; i < suggestions.related_apps.size() && i < kSuggestedAppActions; ++i) {
    suggestions.next_actions.push_back("Switch to " + suggestions.related_apps[i]);
  }

  suggestions.confidence = predictions.empty() ? 0.0 : predictions.front().confidence;
  return suggestions;
}

std::vector<RelatedActivity> RedisEngine::related(const std::string& activity_id, const int max_depth) {
  if (!load_activity(activity_id).has_value()) {
    throw EngineError("activity not found: " + activity_id);
  }

  const auto filter = load_privacy_filter();
  const int depth_limit = std::min(max_depth, config_.graph.max_depth);

  struct Frontier {
    std::string id;
    int depth;
    double weight;
  };

  std::vector<RelatedActivity> related;
  std::unordered_set<std::string> visited{activity_id};
  std::queue<Frontier> frontier;
  frontier.push(Frontier{activity_id, 0, 1.0});

  while (!frontier.empty()) {
    const auto current = frontier.front();
    frontier.pop();
    if (current.depth >= depth_limit) {
      continue;
    }

    const auto edges = neighbours(current.id);
    const double max_weight = edges.empty() ? 0.0 : edges.front().second;
    const double hop_factor = current.depth == 0 ? 1.0 : config_.graph.decay_factor;
    for (const auto& [neighbour_id, edge_weight] : edges) {
      if (max_weight <= 0.0 || !visited.insert(neighbour_id).second) {
        continue;
      }

      const double weight = current.weight * (edge_weight / max_weight) * hop_factor;
      frontier.push(Frontier{neighbour_id, current.depth + 1, weight});

      auto neighbour = load_activity(neighbour_id);
      if (neighbour.has_value() && !filter.blocks(*neighbour)) {
        related.push_back(RelatedActivity{std::move(*neighbour), current.depth + 1, weight});
      }
    }
  }

  std::stable_sort(related.begin(), related.end(), [](const RelatedActivity& lhs, const RelatedActivity& rhs) {
    if (lhs.depth != rhs.depth) {
      return lhs.depth < rhs.depth;
    }
    return lhs.weight > rhs.weight;
  });
  return related;
}

EngineStats RedisEngine::stats() {
  EngineStats stats{};
  stats.activity_count = redis_.integer({"ZCARD", key("activities")});
  stats.context_count = redis_.integer({"ZCARD", key("contexts")});

  const auto oldest = redis_.scored({"ZRANGE", key("activities"), "0", "0", "WITHSCORES"});
  if (!oldest.empty()) {
    stats.oldest_activity_ms = static_cast<std::int64_t>(oldest.front().second);
  }
  const auto newest = redis_.scored({"ZREVRANGE", key("activities"), "0", "0", "WITHSCORES"});
  if (!newest.empty()) {
    stats.newest_activity_ms = static_cast<std::int64_t>(newest.front().second);
  }

  stats.search_scan_limit = config_.search.scan_limit;

  std::string cursor = "0";
  std::int64_t edge_endpoints = 0;
  do {
    const auto reply = redis_.command({"SCAN", cursor, "MATCH", key("graph:*"), "COUNT", kScanBatch});
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 || reply->element[0]->str == nullptr ||
        reply->element[1]->type != REDIS_REPLY_ARRAY) {
      throw EngineError("unexpected reply type from SCAN");
    }

    cursor.assign(reply->element[0]->str, static_cast<std::size_t>(reply->element[0]->len));
    std::vector<std::string> graph_keys;
    const auto* keys = reply->element[1];
    for (std::size_t i = 0; i < keys->elements; ++i) {
      if (keys->element[i]->str != nullptr) {
        graph_keys.emplace_back(keys->element[i]->str, static_cast<std::size_t>(keys->element[i]->len));
      }
    }

    for (const auto& graph : graph_keys) {
      ++stats.graph_nodes;
      edge_endpoints += redis_.integer({"ZCARD", graph});
    }
  } while (cursor != "0");
  stats.graph_edges = edge_endpoints / 2;

  stats.privacy = privacy_stats();
  return stats;
}

std::vector<WorkContext> RedisEngine::list_contexts(const int limit) {
  const auto ids = redis_.strings({"ZREVRANGE", key("contexts"), "0", std::to_string(limit - 1)});

  std::vector<WorkContext> contexts;
  contexts.reserve(ids.size());
  for (const auto& id : ids) {
    const auto fields = redis_.hash({"HGETALL", context_key(id)});
    if (fields.empty()) {
      continue;
    }

    WorkContext context{};
    context.id = id;
    context.name = field_or_empty(fields, "name");
    context.description = field_or_empty(fields, "description");
    context.tags = parse_tags(field_or_empty(fields, "tags"));
    context.created_at_ms = parse_int64(field_or_empty(fields, "created_at"), 0);
    context.last_active_ms = parse_int64(field_or_empty(fields, "last_active"), context.created_at_ms);
    contexts.push_back(std::move(context));
  }
  return contexts;
}

std::int64_t RedisEngine::cleanup(const int days) {
  const auto cutoff = "(" + std::to_string(core::unix_timestamp_now_ms() - core::days_to_ms(days));
  const auto expired = redis_.strings({"ZRANGEBYSCORE", key("activities"), "-inf", cutoff});

  for (const auto& id : expired) {
    for (const auto& neighbour : redis_.strings({"ZRANGE", graph_key(id), "0", "-1"})) {
      (void)redis_.integer({"ZREM", graph_key(neighbour), id});
    }
    (void)redis_.integer({"DEL", activity_key(id), graph_key(id)});
  }

  const auto removed = redis_.integer({"ZREMRANGEBYSCORE", key("activities"), "-inf", cutoff});
  std::cerr << "[engine] cleanup removed " << removed << " activities older than " << days << " days\n";
  return removed;
}

PrivacyStats RedisEngine::update_blacklist(const BlacklistKind kind, const std::string& value,
                                           const BlacklistAction action) {
  if (value.empty()) {
    throw EngineError("blacklist value must not be empty");
  }

  const auto set_key = kind == BlacklistKind::app ? key("privacy:apps") : key("privacy:directories");
  (void)redis_.integer({action == BlacklistAction::add ? "SADD" : "SREM", set_key, value});
  return privacy_stats();
}

std::string RedisEngine::create_context(const std::string& name, const std::string& description,
                                        const std::vector<std::string>& tags) {
  if (name.empty()) {
    throw EngineError("context name must not be empty");
  }

  const auto now = std::to_string(core::unix_timestamp_now_ms());
  const auto encoded_tags = nlohmann::json(tags).dump();

  std::string id;
  if (const auto existing = redis_.bulk_string({"HGET", key("context_names"), name}); existing.has_value()) {
    id = *existing;
    (void)redis_.integer(
        {"HSET", context_key(id), "description", description, "tags", encoded_tags, "last_active", now});
  } else {
    id = "ctx-" + std::to_string(redis_.integer({"INCR", key("context_seq")}));
    (void)redis_.integer({"HSET", context_key(id), "name", name, "description", description, "tags", encoded_tags,
                          "created_at", now, "last_active", now});
    (void)redis_.integer({"HSET", key("context_names"), name, id});
  }

  (void)redis_.integer({"ZADD", key("contexts"), now, id});
  return id;
}

std::unique_ptr<EngineFacade> open_engine(const core::ServerConfig& config) {
  if (!config.engine_enabled) {
    return make_unavailable_engine("engine disabled by configuration");
  }

  try {
    auto engine = std::make_unique<RedisEngine>(config);
    engine->check_connectivity();
    std::cerr << "[engine] connected to redis at " << core::describe_redis_address(config.redis) << '\n';
    return engine;
  } catch (const std::exception& ex) {
    std::cerr << "[engine] initialization failed: " << ex.what() << '\n';
    return make_unavailable_engine(ex.what());
  }
}

}  // namespace context_mcp::engine
