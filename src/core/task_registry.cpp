#include <pubflow/core/task_registry.hpp>
#include <algorithm>

namespace pubflow::core {

std::expected<void, PublishError> TaskRegistry::add(
    const std::shared_ptr<WorkUnit>& unit) {
  if (!unit) {
    return std::unexpected(PublishError::InvalidArgument);
  }
  prune();
  if (contains(*unit)) {
    return std::unexpected(PublishError::DuplicateRegistration);
  }
  units_.push_back(unit);
  return {};
}

bool TaskRegistry::remove(const WorkUnit& unit) {
  const auto it = std::find_if(units_.begin(), units_.end(),
                               [&unit](const std::weak_ptr<WorkUnit>& w) {
                                 return w.lock().get() == &unit;
                               });
  if (it == units_.end()) return false;
  units_.erase(it);
  return true;
}

bool TaskRegistry::contains(const WorkUnit& unit) const {
  return std::any_of(units_.begin(), units_.end(),
                     [&unit](const std::weak_ptr<WorkUnit>& w) {
                       return w.lock().get() == &unit;
                     });
}

std::vector<std::shared_ptr<WorkUnit>> TaskRegistry::units() const {
  std::vector<std::shared_ptr<WorkUnit>> live;
  live.reserve(units_.size());
  for (const auto& w : units_) {
    if (auto unit = w.lock()) {
      live.push_back(std::move(unit));
    }
  }
  return live;
}

std::size_t TaskRegistry::size() const {
  return static_cast<std::size_t>(
      std::count_if(units_.begin(), units_.end(),
                    [](const std::weak_ptr<WorkUnit>& w) { return !w.expired(); }));
}

void TaskRegistry::prune() {
  units_.erase(std::remove_if(units_.begin(), units_.end(),
                              [](const std::weak_ptr<WorkUnit>& w) { return w.expired(); }),
               units_.end());
}

}  // namespace pubflow::core
