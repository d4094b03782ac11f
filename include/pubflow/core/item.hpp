#pragma once

#include <pubflow/core/error.hpp>
#include <pubflow/core/task_registry.hpp>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pubflow::core {

class WorkUnit;

/// A piece of content to be published (a file, a scene, a render...).
/// Only its name and its bound work units matter here; hierarchy and
/// metadata belong to the host application.
class Item {
 public:
  explicit Item(std::string name) : name_(std::move(name)) {}
  virtual ~Item() = default;

  Item(const Item&) = delete;
  Item& operator=(const Item&) = delete;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  /// Called by WorkUnit::create. Override to veto registration.
  [[nodiscard]] virtual std::expected<void, PublishError> add_task(
      const std::shared_ptr<WorkUnit>& unit) {
    return tasks_.add(unit);
  }

  virtual void remove_task(const WorkUnit& unit) { tasks_.remove(unit); }

  /// Work units currently bound to this item, in creation order.
  [[nodiscard]] std::vector<std::shared_ptr<WorkUnit>> tasks() const {
    return tasks_.units();
  }

 private:
  std::string name_;
  TaskRegistry tasks_;
};

}  // namespace pubflow::core
