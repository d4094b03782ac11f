#pragma once

#include <pubflow/core/error.hpp>
#include <pubflow/core/item.hpp>
#include <pubflow/core/plugin.hpp>
#include <pubflow/core/settings.hpp>
#include <expected>
#include <memory>
#include <string>

namespace pubflow::core {

/// One plugin applied to one item: the unit a publish session accepts,
/// validates, executes and finalizes.
///
/// State: accepted / visible / enabled / checked, derived from the plugin's
/// acceptance answers. Only accept() changes it (plus the user's set_checked()).
/// validate(), execute() and finalize() are pass-throughs to the plugin.
///
/// Thread-safety: none. A single driver thread owns the unit; concurrent
/// validate() on distinct units is fine since it touches no unit state.
class WorkUnit {
 public:
  /// Create a unit and register it with \p plugin, then with \p item.
  /// On failure nothing stays registered. Fresh units are visible, enabled,
  /// checked and not accepted.
  [[nodiscard]] static std::expected<std::shared_ptr<WorkUnit>, PublishError> create(
      std::shared_ptr<IPlugin> plugin,
      std::shared_ptr<Item> item,
      Settings settings);

  WorkUnit(const WorkUnit&) = delete;
  WorkUnit& operator=(const WorkUnit&) = delete;

  /// True if both units wrap the same plugin instance.
  [[nodiscard]] bool is_same_type(const WorkUnit& other) const noexcept {
    return plugin_ == other.plugin_;
  }

  [[nodiscard]] const std::shared_ptr<Item>& item() const noexcept { return item_; }
  [[nodiscard]] const std::shared_ptr<IPlugin>& plugin() const noexcept { return plugin_; }

  /// Invisible units are still processed, just not shown to the user.
  [[nodiscard]] bool visible() const noexcept { return visible_; }
  /// Whether the user may change checked().
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }
  /// Whether the unit will run during validate/publish/finalize.
  [[nodiscard]] bool checked() const noexcept { return checked_; }
  [[nodiscard]] bool accepted() const noexcept { return accepted_; }

  [[nodiscard]] const Settings& settings() const noexcept { return settings_; }
  /// Replaces the whole mapping; keys missing from \p settings are gone afterwards.
  void set_settings(Settings settings) { settings_ = std::move(settings); }

  /// User toggle. Fails with NotEnabled when the unit is disabled.
  [[nodiscard]] std::expected<void, PublishError> set_checked(bool checked);

  /// Ask the plugin whether it accepts the item and update state.
  /// Safe to call repeatedly: once accepted, later acceptances refresh
  /// visible/enabled but leave checked alone; a rejection turns the unit off.
  void accept();

  /// Plugin's validation answer, returned unchanged.
  [[nodiscard]] std::expected<bool, StrategyFailure> validate();

  /// Run the plugin's publish step.
  [[nodiscard]] std::expected<void, StrategyFailure> execute();

  /// Run the plugin's finalize step.
  [[nodiscard]] std::expected<void, StrategyFailure> finalize();

  /// "<WorkUnit: plugin for item>"
  [[nodiscard]] std::string describe() const;

 private:
  WorkUnit(std::shared_ptr<IPlugin> plugin, std::shared_ptr<Item> item, Settings settings);

  const std::shared_ptr<IPlugin> plugin_;
  const std::shared_ptr<Item> item_;
  Settings settings_;
  bool accepted_{false};
  bool visible_{true};
  bool enabled_{true};
  bool checked_{true};
};

}  // namespace pubflow::core
