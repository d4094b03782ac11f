/**
 * pubflow-cli — Run a demo publish session over named items; print unit state.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/pubflow_cli [--config path] [--items a,b,c] [--reject name] [--fail-validate name]
 */

#include <pubflow/app/config.hpp>
#include <pubflow/app/publish_runner.hpp>
#include <pubflow/core/error.hpp>
#include <pubflow/core/item.hpp>
#include <pubflow/core/logger.hpp>
#include <pubflow/core/work_unit.hpp>
#include <pubflow/plugins/scripted_plugin.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split_names(const std::string& csv) {
  std::vector<std::string> names;
  std::stringstream ss(csv);
  std::string name;
  while (std::getline(ss, name, ',')) {
    if (!name.empty()) names.push_back(name);
  }
  return names;
}

std::vector<std::shared_ptr<pubflow::plugins::ScriptedPlugin>> build_plugins(
    const pubflow::app::SessionConfig& cfg,
    const std::vector<std::string>& rejected,
    const std::vector<std::string>& invalid) {
  using pubflow::plugins::ScriptedPlugin;

  auto publish_file = std::make_shared<ScriptedPlugin>("Publish to Shotgun");
  for (const auto& name : rejected) publish_file->reject_item(name);
  for (const auto& name : invalid) publish_file->fail_validation_for(name);

  auto upload_version = std::make_shared<ScriptedPlugin>("Upload for review");
  upload_version->set_accept_payload({
      {"accepted", true},
      {"checked", false},
      {"extra_info", {{"reason", "review uploads are opt-in"}}},
  });

  std::vector<std::shared_ptr<ScriptedPlugin>> plugins{publish_file, upload_version};
  for (auto& plugin : plugins) plugin->logger().set_level(cfg.log_level);
  return plugins;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string items_csv = "scene.ma,render.exr";
  std::vector<std::string> rejected;
  std::vector<std::string> invalid;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--items" && i + 1 < argc) {
      items_csv = argv[++i];
    } else if (arg == "--reject" && i + 1 < argc) {
      rejected.emplace_back(argv[++i]);
    } else if (arg == "--fail-validate" && i + 1 < argc) {
      invalid.emplace_back(argv[++i]);
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: pubflow_cli [options]\n"
                << "  --config <path>         Session config (key=value file); default: built-in\n"
                << "  --items <a,b,c>         Item names to publish (default: scene.ma,render.exr)\n"
                << "  --reject <name>         Make the publish plugin reject this item\n"
                << "  --fail-validate <name>  Make the publish plugin fail validation for this item\n";
      return 0;
    }
  }

  pubflow::app::SessionConfig cfg = pubflow::app::default_config();
  if (!config_path.empty()) {
    auto loaded = pubflow::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Invalid config " << config_path << ": "
                << pubflow::core::to_string(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  pubflow::core::library_logger().set_level(cfg.log_level);

  const auto plugins = build_plugins(cfg, rejected, invalid);

  pubflow::app::WorkUnitList units;
  for (const auto& name : split_names(items_csv)) {
    auto item = std::make_shared<pubflow::core::Item>(name);
    for (const auto& plugin : plugins) {
      auto unit = pubflow::core::WorkUnit::create(plugin, item, cfg.default_settings);
      if (!unit) {
        std::cerr << "Could not create unit for " << name << ": "
                  << pubflow::core::to_string(unit.error()) << "\n";
        return 1;
      }
      units.push_back(std::move(*unit));
    }
  }

  auto summary = pubflow::app::run_session(units, cfg);

  for (const auto& unit : units) {
    std::cout << unit->describe() << " accepted=" << unit->accepted()
              << " visible=" << unit->visible() << " enabled=" << unit->enabled()
              << " checked=" << unit->checked() << "\n";
  }

  if (!summary) {
    std::cerr << "Session failed: " << pubflow::core::to_string(summary.error()) << "\n";
    return 1;
  }
  std::cout << "accepted=" << summary->accepted << " checked=" << summary->checked
            << " validated=" << summary->validation.validated << "\n";
  return 0;
}
