#pragma once

#include <pubflow/app/config.hpp>
#include <pubflow/core/error.hpp>
#include <pubflow/core/work_unit.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace pubflow::app {

using WorkUnitList = std::vector<std::shared_ptr<pubflow::core::WorkUnit>>;

/// A checked unit that did not pass validation. \p failure is set when the
/// plugin reported an error rather than answering false.
struct ValidationIssue {
  std::shared_ptr<pubflow::core::WorkUnit> unit;
  std::optional<pubflow::core::StrategyFailure> failure;
};

struct ValidationReport {
  std::size_t validated{0};  // checked units that were validated
  std::vector<ValidationIssue> issues;  // in unit order

  [[nodiscard]] bool ok() const noexcept { return issues.empty(); }
};

/// Failure of publish_all / finalize_all: the unit that failed and what the plugin said.
struct StepFailure {
  std::shared_ptr<pubflow::core::WorkUnit> unit;
  pubflow::core::StrategyFailure failure;
};

struct SessionSummary {
  std::size_t accepted{0};
  std::size_t checked{0};
  ValidationReport validation;
};

/// Runs accept() on every unit in order. Units may be accepted again later
/// (e.g. after settings change); their checked state survives.
void accept_all(const WorkUnitList& units);

/// Validates checked units. num_workers > 1 validates on a thread pool
/// (0 = hardware concurrency); plugins must then tolerate concurrent run_validate().
[[nodiscard]] ValidationReport validate_all(const WorkUnitList& units,
                                            std::size_t num_workers = 1);

/// Publishes checked units in order; stops at the first failure.
[[nodiscard]] std::expected<void, StepFailure> publish_all(const WorkUnitList& units);

/// Finalizes checked units in order; stops at the first failure.
[[nodiscard]] std::expected<void, StepFailure> finalize_all(const WorkUnitList& units);

/// Full session: accept -> validate -> publish -> finalize.
/// Validation issues abort with ValidationFailed when config.stop_on_validation_failure.
/// Publish/finalize failures are logged and returned as PublishFailed/FinalizeFailed.
[[nodiscard]] std::expected<SessionSummary, pubflow::core::PublishError> run_session(
    const WorkUnitList& units, const SessionConfig& config);

}  // namespace pubflow::app
