#pragma once

#include <nlohmann/json.hpp>
#include <optional>

namespace pubflow::core {

/// Outcome of a plugin's acceptance check for one item.
/// Unset optional flags mean "use the default" (true) when accepted.
struct AcceptResult {
  bool accepted{false};
  std::optional<bool> visible;
  std::optional<bool> enabled;
  std::optional<bool> checked;
  nlohmann::json extra_info;  // free-form diagnostic payload, logged with the decision
};

/// Build an AcceptResult from a JSON object such as
/// {"accepted": true, "visible": false, "extra_info": {...}}.
/// Never fails: flags present in the payload are read by truthiness (null, 0,
/// "" and empty containers are false), so a missing or falsy "accepted" reads
/// as a rejection.
[[nodiscard]] AcceptResult parse_accept_result(const nlohmann::json& payload);

}  // namespace pubflow::core
