#include <pubflow/app/publish_runner_tbb.hpp>

#ifdef PUBFLOW_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace pubflow::app {

ValidationReport validate_all_tbb(const WorkUnitList& units) {
  WorkUnitList targets;
  targets.reserve(units.size());
  for (const auto& unit : units) {
    if (unit && unit->checked()) targets.push_back(unit);
  }

  const std::size_t n = targets.size();
  ValidationReport report;
  report.validated = n;
  if (n == 0) return report;

  std::vector<std::optional<ValidationIssue>> slots(n);
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&targets, &slots](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = targets[i]->validate();
          if (!result) {
            slots[i] = ValidationIssue{targets[i], result.error()};
          } else if (!*result) {
            slots[i] = ValidationIssue{targets[i], std::nullopt};
          }
        }
      });

  for (auto& slot : slots) {
    if (slot) report.issues.push_back(std::move(*slot));
  }
  return report;
}

}  // namespace pubflow::app

#endif  // PUBFLOW_HAS_TBB
