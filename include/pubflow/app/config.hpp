#pragma once

#include <pubflow/core/error.hpp>
#include <pubflow/core/logger.hpp>
#include <pubflow/core/settings.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace pubflow::app {

/// Publish session configuration: logging, validation workers, default settings.
struct SessionConfig {
  pubflow::core::LogLevel log_level{pubflow::core::LogLevel::Info};
  std::size_t validate_workers{1};  // 0 = hardware concurrency
  bool stop_on_validation_failure{true};
  pubflow::core::Settings default_settings;  // from "setting.<name>=<value>" lines
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields defaults; malformed values fail with InvalidConfig.
[[nodiscard]] std::expected<SessionConfig, pubflow::core::PublishError> load_config(
    const std::string& path);

/// Default config when no file is provided.
SessionConfig default_config();

}  // namespace pubflow::app
