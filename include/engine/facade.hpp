#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "engine/model.hpp"

namespace context_mcp::engine {

// Raised by every facade operation that cannot be served by the data engine.
class EngineError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class EngineState { ready, unavailable };

constexpr int kDefaultRecentHours = 24;
constexpr int kDefaultRecentLimit = 50;
constexpr int kDefaultSearchLimit = 10;
constexpr int kDefaultPredictMaxResults = 5;
constexpr int kDefaultRelatedMaxDepth = 2;
constexpr int kDefaultContextListLimit = 20;
constexpr int kDefaultCleanupDays = 90;

// Narrow query surface over the activity engine. One operation per tool;
// implementations know nothing about JSON-RPC framing.
class EngineFacade {
 public:
  virtual ~EngineFacade() = default;

  [[nodiscard]] virtual EngineState state() const = 0;

  // Reason the engine is unavailable; empty while ready.
  [[nodiscard]] virtual std::string unavailable_reason() const { return {}; }

  virtual std::vector<Activity> recent_activities(int hours, int limit) = 0;
  virtual std::vector<SearchResult> search(const std::string& query, int limit) = 0;
  virtual std::vector<Prediction> predict(const std::string& activity_description, int max_results) = 0;
  virtual ContextSuggestions suggestions(const std::string& activity_description) = 0;
  virtual std::vector<RelatedActivity> related(const std::string& activity_id, int max_depth) = 0;
  virtual EngineStats stats() = 0;
  virtual std::vector<WorkContext> list_contexts(int limit) = 0;

  // Returns the number of activities removed.
  virtual std::int64_t cleanup(int days) = 0;

  virtual PrivacyStats update_blacklist(BlacklistKind kind, const std::string& value, BlacklistAction action) = 0;

  // Creates the named context or refreshes the existing one; returns its id.
  virtual std::string create_context(const std::string& name, const std::string& description,
                                     const std::vector<std::string>& tags) = 0;
};

// Placeholder facade used when the engine could not be constructed.
std::unique_ptr<EngineFacade> make_unavailable_engine(std::string reason);

// Never throws: construction failures yield an unavailable engine.
std::unique_ptr<EngineFacade> open_engine(const core::ServerConfig& config);

}  // namespace context_mcp::engine
