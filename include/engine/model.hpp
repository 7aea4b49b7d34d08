#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace context_mcp::engine {

struct Activity {
  std::string id;
  std::int64_t timestamp_ms{0};
  std::string app_name;
  std::string window_title;
  std::string file_path;
  std::string context_id;
};

struct SearchResult {
  Activity activity;
  double score{0.0};
};

struct Prediction {
  Activity activity;
  double confidence{0.0};
  std::string reason;
};

struct ContextSuggestions {
  std::vector<std::string> related_files;
  std::vector<std::string> related_apps;
  std::vector<std::string> next_actions;
  double confidence{0.0};
};

struct RelatedActivity {
  Activity activity;
  int depth{0};
  double weight{0.0};
};

struct WorkContext {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> tags;
  std::int64_t created_at_ms{0};
  std::int64_t last_active_ms{0};
};

struct PrivacyStats {
  std::vector<std::string> blacklisted_apps;
  std::vector<std::string> blacklisted_directories;
};

struct EngineStats {
  std::int64_t activity_count{0};
  std::int64_t context_count{0};
  std::int64_t oldest_activity_ms{0};
  std::int64_t newest_activity_ms{0};
  std::size_t search_scan_limit{0};
  std::int64_t graph_nodes{0};
  std::int64_t graph_edges{0};
  PrivacyStats privacy{};
};

enum class BlacklistKind { app, directory };

enum class BlacklistAction { add, remove };

}  // namespace context_mcp::engine
