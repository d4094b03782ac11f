#pragma once

#include <pubflow/core/accept_result.hpp>
#include <pubflow/core/error.hpp>
#include <pubflow/core/item.hpp>
#include <pubflow/core/plugin.hpp>
#include <pubflow/core/settings.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pubflow::plugins {

/// Plugin whose answers are configured up front (for tests/demo).
/// Every call is recorded; recording is thread-safe so parallel validation works.
class ScriptedPlugin : public pubflow::core::IPlugin {
 public:
  enum class Operation { Accept, Validate, Publish, Finalize };

  struct Call {
    Operation operation;
    std::string item_name;
    pubflow::core::Settings settings;
  };

  explicit ScriptedPlugin(std::string name);

  /// JSON answer for run_accept (parsed leniently). Default: {"accepted": true}.
  void set_accept_payload(nlohmann::json payload);
  /// Items named here are rejected regardless of the accept payload.
  void reject_item(std::string item_name);

  void set_validate_result(bool ok);
  /// Items named here fail validation (false, not an error).
  void fail_validation_for(std::string item_name);
  void fail_validate_with(pubflow::core::StrategyFailure failure);
  void fail_publish_with(pubflow::core::StrategyFailure failure);
  void fail_finalize_with(pubflow::core::StrategyFailure failure);

  [[nodiscard]] pubflow::core::AcceptResult run_accept(
      const pubflow::core::Settings& settings, pubflow::core::Item& item) override;

  [[nodiscard]] std::expected<bool, pubflow::core::StrategyFailure> run_validate(
      const pubflow::core::Settings& settings, pubflow::core::Item& item) override;

  [[nodiscard]] std::expected<void, pubflow::core::StrategyFailure> run_publish(
      const pubflow::core::Settings& settings, pubflow::core::Item& item) override;

  [[nodiscard]] std::expected<void, pubflow::core::StrategyFailure> run_finalize(
      const pubflow::core::Settings& settings, pubflow::core::Item& item) override;

  [[nodiscard]] std::vector<Call> calls() const;
  [[nodiscard]] std::size_t call_count(Operation operation) const;

 private:
  void record(Operation operation, const pubflow::core::Settings& settings,
              const pubflow::core::Item& item);

  mutable std::mutex mutex_;
  nlohmann::json accept_payload_;
  std::unordered_set<std::string> rejected_items_;
  bool validate_result_{true};
  std::unordered_set<std::string> invalid_items_;
  std::optional<pubflow::core::StrategyFailure> validate_failure_;
  std::optional<pubflow::core::StrategyFailure> publish_failure_;
  std::optional<pubflow::core::StrategyFailure> finalize_failure_;
  std::vector<Call> calls_;
};

}  // namespace pubflow::plugins
