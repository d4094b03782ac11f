#pragma once

#include <pubflow/core/error.hpp>
#include <expected>
#include <memory>
#include <vector>

namespace pubflow::core {

class WorkUnit;

/// Non-owning list of the work units bound to a plugin or item.
/// Holds weak references: a unit disappears from the list once the driver drops it.
class TaskRegistry {
 public:
  /// Fails with InvalidArgument for null and DuplicateRegistration if already present.
  [[nodiscard]] std::expected<void, PublishError> add(
      const std::shared_ptr<WorkUnit>& unit);

  /// Returns true if \p unit was registered.
  bool remove(const WorkUnit& unit);

  [[nodiscard]] bool contains(const WorkUnit& unit) const;

  /// Live units in registration order.
  [[nodiscard]] std::vector<std::shared_ptr<WorkUnit>> units() const;

  [[nodiscard]] std::size_t size() const;

 private:
  void prune();

  std::vector<std::weak_ptr<WorkUnit>> units_;
};

}  // namespace pubflow::core
