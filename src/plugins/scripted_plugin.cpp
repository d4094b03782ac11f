#include <pubflow/plugins/scripted_plugin.hpp>
#include <algorithm>

namespace pubflow::plugins {

namespace pc = pubflow::core;

ScriptedPlugin::ScriptedPlugin(std::string name)
    : pc::IPlugin(std::move(name)),
      accept_payload_(nlohmann::json{{"accepted", true}}) {}

void ScriptedPlugin::set_accept_payload(nlohmann::json payload) {
  std::lock_guard lock(mutex_);
  accept_payload_ = std::move(payload);
}

void ScriptedPlugin::reject_item(std::string item_name) {
  std::lock_guard lock(mutex_);
  rejected_items_.insert(std::move(item_name));
}

void ScriptedPlugin::set_validate_result(bool ok) {
  std::lock_guard lock(mutex_);
  validate_result_ = ok;
}

void ScriptedPlugin::fail_validation_for(std::string item_name) {
  std::lock_guard lock(mutex_);
  invalid_items_.insert(std::move(item_name));
}

void ScriptedPlugin::fail_validate_with(pc::StrategyFailure failure) {
  std::lock_guard lock(mutex_);
  validate_failure_ = std::move(failure);
}

void ScriptedPlugin::fail_publish_with(pc::StrategyFailure failure) {
  std::lock_guard lock(mutex_);
  publish_failure_ = std::move(failure);
}

void ScriptedPlugin::fail_finalize_with(pc::StrategyFailure failure) {
  std::lock_guard lock(mutex_);
  finalize_failure_ = std::move(failure);
}

void ScriptedPlugin::record(Operation operation, const pc::Settings& settings,
                            const pc::Item& item) {
  calls_.push_back({operation, item.name(), settings});
}

pc::AcceptResult ScriptedPlugin::run_accept(const pc::Settings& settings, pc::Item& item) {
  std::lock_guard lock(mutex_);
  record(Operation::Accept, settings, item);
  if (rejected_items_.contains(item.name())) {
    return pc::parse_accept_result(nlohmann::json{{"accepted", false}});
  }
  return pc::parse_accept_result(accept_payload_);
}

std::expected<bool, pc::StrategyFailure> ScriptedPlugin::run_validate(
    const pc::Settings& settings, pc::Item& item) {
  std::lock_guard lock(mutex_);
  record(Operation::Validate, settings, item);
  if (validate_failure_) {
    return std::unexpected(*validate_failure_);
  }
  if (invalid_items_.contains(item.name())) {
    return false;
  }
  return validate_result_;
}

std::expected<void, pc::StrategyFailure> ScriptedPlugin::run_publish(
    const pc::Settings& settings, pc::Item& item) {
  std::lock_guard lock(mutex_);
  record(Operation::Publish, settings, item);
  if (publish_failure_) {
    return std::unexpected(*publish_failure_);
  }
  return {};
}

std::expected<void, pc::StrategyFailure> ScriptedPlugin::run_finalize(
    const pc::Settings& settings, pc::Item& item) {
  std::lock_guard lock(mutex_);
  record(Operation::Finalize, settings, item);
  if (finalize_failure_) {
    return std::unexpected(*finalize_failure_);
  }
  return {};
}

std::vector<ScriptedPlugin::Call> ScriptedPlugin::calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::size_t ScriptedPlugin::call_count(Operation operation) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(calls_.begin(), calls_.end(),
                    [operation](const Call& c) { return c.operation == operation; }));
}

}  // namespace pubflow::plugins
