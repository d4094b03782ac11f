#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace pubflow::core {

/// Settings snapshot handed to every plugin call: setting name -> arbitrary value.
/// Replaced wholesale on a work unit, never merged.
using Settings = std::unordered_map<std::string, nlohmann::json>;

}  // namespace pubflow::core
