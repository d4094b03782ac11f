#include <pubflow/core/work_unit.hpp>
#include <pubflow/core/accept_result.hpp>
#include <pubflow/core/logger.hpp>

namespace pubflow::core {

WorkUnit::WorkUnit(std::shared_ptr<IPlugin> plugin,
                   std::shared_ptr<Item> item,
                   Settings settings)
    : plugin_(std::move(plugin)),
      item_(std::move(item)),
      settings_(std::move(settings)) {}

std::expected<std::shared_ptr<WorkUnit>, PublishError> WorkUnit::create(
    std::shared_ptr<IPlugin> plugin,
    std::shared_ptr<Item> item,
    Settings settings) {
  if (!plugin || !item) {
    return std::unexpected(PublishError::InvalidArgument);
  }

  std::shared_ptr<WorkUnit> unit(
      new WorkUnit(std::move(plugin), std::move(item), std::move(settings)));

  auto plugin_registered = unit->plugin_->add_task(unit);
  if (!plugin_registered) {
    return std::unexpected(plugin_registered.error());
  }
  auto item_registered = unit->item_->add_task(unit);
  if (!item_registered) {
    unit->plugin_->remove_task(*unit);
    return std::unexpected(item_registered.error());
  }

  library_logger().debug("Created " + unit->describe());
  return unit;
}

std::expected<void, PublishError> WorkUnit::set_checked(bool checked) {
  if (!enabled_) {
    return std::unexpected(PublishError::NotEnabled);
  }
  checked_ = checked;
  return {};
}

void WorkUnit::accept() {
  const AcceptResult result = plugin_->run_accept(settings_, *item_);

  if (result.accepted) {
    plugin_->logger().info(
        "Plugin: '" + plugin_->name() + "' - Accepted: " + item_->name(),
        result.extra_info);

    visible_ = result.visible.value_or(true);
    enabled_ = result.enabled.value_or(true);

    // Only the first acceptance picks the checked state; afterwards it is the user's.
    if (!accepted_) {
      accepted_ = true;
      checked_ = result.checked.value_or(true);
    }
    return;
  }

  plugin_->logger().info(
      "Plugin: '" + plugin_->name() + "' - Rejected: " + item_->name(),
      result.extra_info);
  accepted_ = false;
  enabled_ = false;
  checked_ = false;
}

std::expected<bool, StrategyFailure> WorkUnit::validate() {
  return plugin_->run_validate(settings_, *item_);
}

std::expected<void, StrategyFailure> WorkUnit::execute() {
  return plugin_->run_publish(settings_, *item_);
}

std::expected<void, StrategyFailure> WorkUnit::finalize() {
  return plugin_->run_finalize(settings_, *item_);
}

std::string WorkUnit::describe() const {
  return "<WorkUnit: " + plugin_->name() + " for " + item_->name() + ">";
}

}  // namespace pubflow::core
