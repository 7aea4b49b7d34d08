#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/config.hpp"
#include "engine/facade.hpp"
#include "engine/redis_client.hpp"

namespace context_mcp::engine {

// Facade over the activity daemon's Redis keyspace (see configs/context-mcp.yaml
// for the prefix). Activities, the temporal graph, contexts and the privacy
// blacklists all live under one key prefix.
class RedisEngine final : public EngineFacade {
 public:
  explicit RedisEngine(core::ServerConfig config);

  // Connects and issues PING; throws EngineError when the store is unreachable.
  void check_connectivity();

  [[nodiscard]] EngineState state() const override { return EngineState::ready; }

  std::vector<Activity> recent_activities(int hours, int limit) override;
  std::vector<SearchResult> search(const std::string& query, int limit) override;
  std::vector<Prediction> predict(const std::string& activity_description, int max_results) override;
  ContextSuggestions suggestions(const std::string& activity_description) override;
  std::vector<RelatedActivity> related(const std::string& activity_id, int max_depth) override;
  EngineStats stats() override;
  std::vector<WorkContext> list_contexts(int limit) override;
  std::int64_t cleanup(int days) override;
  PrivacyStats update_blacklist(BlacklistKind kind, const std::string& value, BlacklistAction action) override;
  std::string create_context(const std::string& name, const std::string& description,
                             const std::vector<std::string>& tags) override;

 private:
  struct PrivacyFilter {
    std::unordered_set<std::string> apps;
    std::vector<std::string> directories;

    [[nodiscard]] bool blocks(const Activity& activity) const;
  };

  [[nodiscard]] std::string key(const std::string& suffix) const;
  [[nodiscard]] std::string activity_key(const std::string& id) const;
  [[nodiscard]] std::string graph_key(const std::string& id) const;
  [[nodiscard]] std::string context_key(const std::string& id) const;

  std::optional<Activity> load_activity(const std::string& id);
  std::vector<Activity> load_visible(const std::vector<std::string>& ids, const PrivacyFilter& filter);
  ScoredMembers neighbours(const std::string& id);
  PrivacyFilter load_privacy_filter();
  PrivacyStats privacy_stats();
  std::vector<SearchResult> score_candidates(const std::string& text, const PrivacyFilter& filter);

  core::ServerConfig config_;
  RedisClient redis_;
};

}  // namespace context_mcp::engine
