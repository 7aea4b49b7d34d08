#include "engine/facade.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace context_mcp::engine {
namespace {

class UnavailableEngine final : public EngineFacade {
 public:
  explicit UnavailableEngine(std::string reason) : reason_(std::move(reason)) {}

  [[nodiscard]] EngineState state() const override { return EngineState::unavailable; }
  [[nodiscard]] std::string unavailable_reason() const override { return reason_; }

  std::vector<Activity> recent_activities(int, int) override { fail(); }
  std::vector<SearchResult> search(const std::string&, int) override { fail(); }
  std::vector<Prediction> predict(const std::string&, int) override { fail(); }
  ContextSuggestions suggestions(const std::string&) override { fail(); }
  std::vector<RelatedActivity> related(const std::string&, int) override { fail(); }
  EngineStats stats() override { fail(); }
  std::vector<WorkContext> list_contexts(int) override { fail(); }
  std::int64_t cleanup(int) override { fail(); }
  PrivacyStats update_blacklist(BlacklistKind, const std::string&, BlacklistAction) override { fail(); }
  std::string create_context(const std::string&, const std::string&, const std::vector<std::string>&) override {
    fail();
  }

 private:
  [[noreturn]] void fail() const { throw EngineError("engine unavailable: " + reason_); }

  std::string reason_;
};

}  // namespace

std::unique_ptr<EngineFacade> make_unavailable_engine(std::string reason) {
  return std::make_unique<UnavailableEngine>(std::move(reason));
}

}  // namespace context_mcp::engine
