#include <pubflow/core/accept_result.hpp>
#include <cstdint>
#include <string>

namespace pubflow::core {

namespace {

/// Truthiness of a JSON value: false, null, 0, "", [] and {} are false.
bool truthy(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::boolean:
      return value.get<bool>();
    case nlohmann::json::value_t::number_integer:
      return value.get<std::int64_t>() != 0;
    case nlohmann::json::value_t::number_unsigned:
      return value.get<std::uint64_t>() != 0;
    case nlohmann::json::value_t::number_float:
      return value.get<double>() != 0.0;
    case nlohmann::json::value_t::string:
      return !value.get_ref<const std::string&>().empty();
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
      return !value.empty();
    default:
      return false;
  }
}

std::optional<bool> flag(const nlohmann::json& payload, const char* key) {
  const auto it = payload.find(key);
  if (it == payload.end()) return std::nullopt;
  return truthy(*it);
}

}  // namespace

AcceptResult parse_accept_result(const nlohmann::json& payload) {
  AcceptResult r;
  if (!payload.is_object()) return r;

  r.accepted = flag(payload, "accepted").value_or(false);
  r.visible = flag(payload, "visible");
  r.enabled = flag(payload, "enabled");
  r.checked = flag(payload, "checked");
  if (const auto it = payload.find("extra_info"); it != payload.end()) {
    r.extra_info = *it;
  }
  return r;
}

}  // namespace pubflow::core
