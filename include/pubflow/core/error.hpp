#pragma once

#include <string>

namespace pubflow::core {

/// Publish error codes; used with std::expected for recoverable failures.
enum class PublishError {
  None = 0,
  InvalidArgument,
  DuplicateRegistration,
  NotEnabled,
  InvalidConfig,
  ValidationFailed,
  PublishFailed,
  FinalizeFailed,
};

/// Failure reported by a plugin from run_validate / run_publish / run_finalize.
/// Work units hand it back to the driver untouched.
struct StrategyFailure {
  PublishError code{PublishError::None};
  std::string message;
};

[[nodiscard]] const char* to_string(PublishError error) noexcept;

}  // namespace pubflow::core
