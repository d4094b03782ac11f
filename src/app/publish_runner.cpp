#include <pubflow/app/publish_runner.hpp>
#include <pubflow/core/logger.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pubflow::app {

namespace pc = pubflow::core;

namespace {

/// Requested worker count, capped by the number of units; 0 asks the hardware.
std::size_t worker_count(std::size_t requested, std::size_t units) {
  std::size_t count = requested;
  if (count == 0) count = std::max(1u, std::thread::hardware_concurrency());
  return std::min(count, units);
}

WorkUnitList checked_units(const WorkUnitList& units) {
  WorkUnitList out;
  out.reserve(units.size());
  for (const auto& unit : units) {
    if (unit && unit->checked()) out.push_back(unit);
  }
  return out;
}

/// Validate one unit; returns an issue when it did not pass.
std::optional<ValidationIssue> validate_one(const std::shared_ptr<pc::WorkUnit>& unit) {
  auto result = unit->validate();
  if (!result) {
    return ValidationIssue{unit, result.error()};
  }
  if (!*result) {
    return ValidationIssue{unit, std::nullopt};
  }
  return std::nullopt;
}

ValidationReport validate_sequential(const WorkUnitList& targets) {
  ValidationReport report;
  report.validated = targets.size();
  for (const auto& unit : targets) {
    if (auto issue = validate_one(unit)) {
      report.issues.push_back(std::move(*issue));
    }
  }
  return report;
}

template <typename Step>
std::expected<void, StepFailure> run_step(const WorkUnitList& units, Step step) {
  for (const auto& unit : units) {
    if (!unit || !unit->checked()) continue;
    auto result = step(*unit);
    if (!result) {
      return std::unexpected(StepFailure{unit, std::move(result.error())});
    }
  }
  return {};
}

}  // namespace

void accept_all(const WorkUnitList& units) {
  for (const auto& unit : units) {
    if (unit) unit->accept();
  }
}

ValidationReport validate_all(const WorkUnitList& units, std::size_t num_workers) {
  const WorkUnitList targets = checked_units(units);
  const std::size_t n = targets.size();
  if (n == 0) return {};

  const std::size_t workers = worker_count(num_workers, n);
  if (workers <= 1) {
    return validate_sequential(targets);
  }

  // Workers claim indices; issues are stored per index to keep unit order.
  // The first exception a plugin throws stops further claims and is rethrown here.
  std::vector<std::optional<ValidationIssue>> slots(n);
  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  auto worker = [&]() {
    while (!failed.load()) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= n) break;
      try {
        slots[idx] = validate_one(targets[idx]);
      } catch (...) {
        std::lock_guard lock(error_mutex);
        if (!first_error) first_error = std::current_exception();
        failed = true;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }

  ValidationReport report;
  report.validated = n;
  for (auto& slot : slots) {
    if (slot) report.issues.push_back(std::move(*slot));
  }
  return report;
}

std::expected<void, StepFailure> publish_all(const WorkUnitList& units) {
  return run_step(units, [](pc::WorkUnit& unit) { return unit.execute(); });
}

std::expected<void, StepFailure> finalize_all(const WorkUnitList& units) {
  return run_step(units, [](pc::WorkUnit& unit) { return unit.finalize(); });
}

std::expected<SessionSummary, pc::PublishError> run_session(
    const WorkUnitList& units, const SessionConfig& config) {
  pc::Logger& log = pc::library_logger();
  SessionSummary summary;

  accept_all(units);
  for (const auto& unit : units) {
    if (!unit) continue;
    if (unit->accepted()) ++summary.accepted;
    if (unit->checked()) ++summary.checked;
  }

  summary.validation = validate_all(units, config.validate_workers);
  for (const auto& issue : summary.validation.issues) {
    nlohmann::json extra = nullptr;
    if (issue.failure) {
      extra = {{"code", pc::to_string(issue.failure->code)},
               {"message", issue.failure->message}};
    }
    log.warn("Validation failed: " + issue.unit->describe(), extra);
  }
  if (!summary.validation.ok() && config.stop_on_validation_failure) {
    return std::unexpected(pc::PublishError::ValidationFailed);
  }

  if (auto published = publish_all(units); !published) {
    log.error("Publish failed: " + published.error().unit->describe(),
              {{"message", published.error().failure.message}});
    return std::unexpected(pc::PublishError::PublishFailed);
  }

  if (auto finalized = finalize_all(units); !finalized) {
    log.error("Finalize failed: " + finalized.error().unit->describe(),
              {{"message", finalized.error().failure.message}});
    return std::unexpected(pc::PublishError::FinalizeFailed);
  }

  return summary;
}

}  // namespace pubflow::app
