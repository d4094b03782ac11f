#include <pubflow/app/config.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

namespace pubflow::app {

namespace {

constexpr std::string_view kSettingPrefix = "setting.";

std::string_view strip(std::string_view text) {
  constexpr std::string_view kBlank = " \t\r\n";
  const auto first = text.find_first_not_of(kBlank);
  if (first == std::string_view::npos) return {};
  return text.substr(first, text.find_last_not_of(kBlank) - first + 1);
}

/// "key = value" -> (key, value), both stripped; nullopt without '=' or key.
std::optional<std::pair<std::string, std::string>> split_entry(std::string_view line) {
  const auto eq = line.find('=');
  if (eq == std::string_view::npos) return std::nullopt;
  const std::string_view key = strip(line.substr(0, eq));
  if (key.empty()) return std::nullopt;
  return std::pair{std::string(key), std::string(strip(line.substr(eq + 1)))};
}

bool parse_size(const std::string& value, std::size_t& out) {
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool parse_bool(const std::string& value, bool& out) {
  if (value == "true" || value == "1" || value == "yes") {
    out = true;
    return true;
  }
  if (value == "false" || value == "0" || value == "no") {
    out = false;
    return true;
  }
  return false;
}

/// JSON literal when it parses, otherwise the raw text as a string.
nlohmann::json parse_setting_value(const std::string& value) {
  auto parsed = nlohmann::json::parse(value, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) return value;
  return parsed;
}

}  // namespace

SessionConfig default_config() {
  SessionConfig c;
  c.log_level = pubflow::core::default_log_level();
  c.validate_workers = 1;
  c.stop_on_validation_failure = true;
  return c;
}

std::expected<SessionConfig, pubflow::core::PublishError> load_config(
    const std::string& path) {
  SessionConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string raw;
  while (std::getline(f, raw)) {
    const std::string_view line = strip(raw);
    if (line.empty() || line.front() == '#') continue;
    auto entry = split_entry(line);
    if (!entry) continue;
    const auto& [key, value] = *entry;

    if (key == "log_level") {
      const auto level = pubflow::core::parse_log_level(value);
      if (!level) {
        return std::unexpected(pubflow::core::PublishError::InvalidConfig);
      }
      c.log_level = *level;
    } else if (key == "validate_workers") {
      if (!parse_size(value, c.validate_workers)) {
        return std::unexpected(pubflow::core::PublishError::InvalidConfig);
      }
    } else if (key == "stop_on_validation_failure") {
      if (!parse_bool(value, c.stop_on_validation_failure)) {
        return std::unexpected(pubflow::core::PublishError::InvalidConfig);
      }
    } else if (key.starts_with(kSettingPrefix) && key.size() > kSettingPrefix.size()) {
      c.default_settings[key.substr(kSettingPrefix.size())] = parse_setting_value(value);
    }
  }
  return c;
}

}  // namespace pubflow::app
