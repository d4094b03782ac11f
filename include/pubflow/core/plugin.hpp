#pragma once

#include <pubflow/core/accept_result.hpp>
#include <pubflow/core/error.hpp>
#include <pubflow/core/item.hpp>
#include <pubflow/core/logger.hpp>
#include <pubflow/core/settings.hpp>
#include <pubflow/core/task_registry.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace pubflow::core {

class WorkUnit;

/// Abstract publish plugin: decides which items it handles and does the work.
/// Implement run_accept() and run_validate(); optionally override run_publish,
/// run_finalize and the registration hooks.
///
/// One plugin instance is shared by every work unit created from it. Drivers that
/// validate in parallel call run_validate() concurrently on distinct items.
class IPlugin {
 public:
  explicit IPlugin(std::string name);
  virtual ~IPlugin() = default;

  IPlugin(const IPlugin&) = delete;
  IPlugin& operator=(const IPlugin&) = delete;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  /// Logger named "pubflow.plugin.<name>"; acceptance decisions are reported here.
  [[nodiscard]] Logger& logger() noexcept { return logger_; }
  [[nodiscard]] const Logger& logger() const noexcept { return logger_; }

  /// Decide whether this plugin handles \p item. Must be implemented.
  [[nodiscard]] virtual AcceptResult run_accept(const Settings& settings, Item& item) = 0;

  /// Check that \p item can be published. Must be implemented.
  [[nodiscard]] virtual std::expected<bool, StrategyFailure> run_validate(
      const Settings& settings, Item& item) = 0;

  /// Optional: publish \p item. Default: no-op.
  [[nodiscard]] virtual std::expected<void, StrategyFailure> run_publish(
      const Settings& /*settings*/, Item& /*item*/) {
    return {};
  }

  /// Optional: post-publish step. Default: no-op.
  [[nodiscard]] virtual std::expected<void, StrategyFailure> run_finalize(
      const Settings& /*settings*/, Item& /*item*/) {
    return {};
  }

  /// Called by WorkUnit::create before the item is told. Override to veto registration.
  [[nodiscard]] virtual std::expected<void, PublishError> add_task(
      const std::shared_ptr<WorkUnit>& unit) {
    return tasks_.add(unit);
  }

  virtual void remove_task(const WorkUnit& unit) { tasks_.remove(unit); }

  /// Work units created from this plugin, in creation order.
  [[nodiscard]] std::vector<std::shared_ptr<WorkUnit>> tasks() const {
    return tasks_.units();
  }

 private:
  std::string name_;
  Logger logger_;
  TaskRegistry tasks_;
};

}  // namespace pubflow::core
