#include <pubflow/app/config.hpp>
#include <pubflow/app/publish_runner.hpp>
#include <pubflow/core/accept_result.hpp>
#include <pubflow/core/item.hpp>
#include <pubflow/core/plugin.hpp>
#include <pubflow/core/work_unit.hpp>
#include <pubflow/plugins/scripted_plugin.hpp>
#include <gtest/gtest.h>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pa = pubflow::app;
namespace pc = pubflow::core;
namespace pp = pubflow::plugins;

namespace {

using Op = pp::ScriptedPlugin::Operation;

pa::WorkUnitList make_units(const std::shared_ptr<pp::ScriptedPlugin>& plugin,
                            const std::vector<std::string>& item_names) {
  pa::WorkUnitList units;
  for (const auto& name : item_names) {
    auto unit = pc::WorkUnit::create(plugin, std::make_shared<pc::Item>(name), {});
    EXPECT_TRUE(unit.has_value());
    if (unit) units.push_back(std::move(*unit));
  }
  return units;
}

/// Plugin whose validation throws instead of answering.
class ThrowingValidatePlugin : public pc::IPlugin {
 public:
  ThrowingValidatePlugin() : pc::IPlugin("throwing") {}

  pc::AcceptResult run_accept(const pc::Settings&, pc::Item&) override {
    return pc::parse_accept_result(nlohmann::json{{"accepted", true}});
  }

  std::expected<bool, pc::StrategyFailure> run_validate(const pc::Settings&,
                                                        pc::Item&) override {
    throw std::runtime_error("plugin blew up");
  }
};

pa::WorkUnitList make_throwing_units(int count) {
  auto plugin = std::make_shared<ThrowingValidatePlugin>();
  pa::WorkUnitList units;
  for (int i = 0; i < count; ++i) {
    auto unit = pc::WorkUnit::create(
        plugin, std::make_shared<pc::Item>("item_" + std::to_string(i)), {});
    EXPECT_TRUE(unit.has_value());
    if (unit) units.push_back(std::move(*unit));
  }
  return units;
}

}  // namespace

TEST(PublishRunnerTest, AcceptAllUpdatesEveryUnit) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->reject_item("b");
  auto units = make_units(plugin, {"a", "b", "c"});
  pa::accept_all(units);
  EXPECT_TRUE(units[0]->accepted());
  EXPECT_FALSE(units[1]->accepted());
  EXPECT_FALSE(units[1]->checked());
  EXPECT_TRUE(units[2]->accepted());
  EXPECT_EQ(plugin->call_count(Op::Accept), 3u);
}

TEST(PublishRunnerTest, ValidateSkipsUncheckedUnits) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->reject_item("b");
  auto units = make_units(plugin, {"a", "b"});
  pa::accept_all(units);

  auto report = pa::validate_all(units);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.validated, 1u);
  EXPECT_EQ(plugin->call_count(Op::Validate), 1u);
}

TEST(PublishRunnerTest, ValidateCollectsFalseAnswersInOrder) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->fail_validation_for("b");
  plugin->fail_validation_for("d");
  auto units = make_units(plugin, {"a", "b", "c", "d"});

  auto report = pa::validate_all(units);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.validated, 4u);
  ASSERT_EQ(report.issues.size(), 2u);
  EXPECT_EQ(report.issues[0].unit, units[1]);
  EXPECT_FALSE(report.issues[0].failure.has_value());
  EXPECT_EQ(report.issues[1].unit, units[3]);
}

TEST(PublishRunnerTest, ValidateCarriesStrategyFailure) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->fail_validate_with({pc::PublishError::ValidationFailed, "no camera"});
  auto units = make_units(plugin, {"a"});

  auto report = pa::validate_all(units);
  ASSERT_EQ(report.issues.size(), 1u);
  ASSERT_TRUE(report.issues[0].failure.has_value());
  EXPECT_EQ(report.issues[0].failure->message, "no camera");
}

TEST(PublishRunnerTest, ParallelValidationMatchesSequential) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  std::vector<std::string> names;
  for (int i = 0; i < 32; ++i) names.push_back("item_" + std::to_string(i));
  plugin->fail_validation_for("item_3");
  plugin->fail_validation_for("item_17");
  auto units = make_units(plugin, names);

  auto report = pa::validate_all(units, 4);
  EXPECT_EQ(report.validated, 32u);
  ASSERT_EQ(report.issues.size(), 2u);
  EXPECT_EQ(report.issues[0].unit, units[3]);
  EXPECT_EQ(report.issues[1].unit, units[17]);
  EXPECT_EQ(plugin->call_count(Op::Validate), 32u);
}

TEST(PublishRunnerTest, EmptyListValidatesNothing) {
  auto report = pa::validate_all({}, 0);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.validated, 0u);
}

TEST(PublishRunnerTest, PublishStopsAtFirstFailure) {
  auto good = std::make_shared<pp::ScriptedPlugin>("good");
  auto bad = std::make_shared<pp::ScriptedPlugin>("bad");
  bad->fail_publish_with({pc::PublishError::PublishFailed, "quota"});
  auto after = std::make_shared<pp::ScriptedPlugin>("after");

  pa::WorkUnitList units;
  for (const auto& plugin : {good, bad, after}) {
    auto more = make_units(plugin, {"a"});
    units.insert(units.end(), more.begin(), more.end());
  }

  auto published = pa::publish_all(units);
  ASSERT_FALSE(published.has_value());
  EXPECT_EQ(published.error().unit, units[1]);
  EXPECT_EQ(published.error().failure.message, "quota");
  EXPECT_EQ(good->call_count(Op::Publish), 1u);
  EXPECT_EQ(after->call_count(Op::Publish), 0u);
}

TEST(PublishRunnerTest, FinalizeSkipsUncheckedUnits) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->set_accept_payload({{"accepted", true}, {"checked", false}});
  auto units = make_units(plugin, {"a", "b"});
  pa::accept_all(units);
  ASSERT_TRUE(units[1]->set_checked(true).has_value());

  ASSERT_TRUE(pa::finalize_all(units).has_value());
  auto calls = plugin->calls();
  ASSERT_EQ(plugin->call_count(Op::Finalize), 1u);
  EXPECT_EQ(calls.back().item_name, "b");
}

TEST(PublishRunnerTest, SessionRunsAllSteps) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->reject_item("c");
  auto units = make_units(plugin, {"a", "b", "c"});

  auto summary = pa::run_session(units, pa::default_config());
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->accepted, 2u);
  EXPECT_EQ(summary->checked, 2u);
  EXPECT_EQ(summary->validation.validated, 2u);
  EXPECT_EQ(plugin->call_count(Op::Publish), 2u);
  EXPECT_EQ(plugin->call_count(Op::Finalize), 2u);
}

TEST(PublishRunnerTest, SessionStopsOnValidationFailure) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->fail_validation_for("b");
  auto units = make_units(plugin, {"a", "b"});

  auto summary = pa::run_session(units, pa::default_config());
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), pc::PublishError::ValidationFailed);
  EXPECT_EQ(plugin->call_count(Op::Publish), 0u);
}

TEST(PublishRunnerTest, SessionContinuesWhenConfigured) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->fail_validation_for("b");
  auto units = make_units(plugin, {"a", "b"});

  pa::SessionConfig cfg = pa::default_config();
  cfg.stop_on_validation_failure = false;
  auto summary = pa::run_session(units, cfg);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->validation.issues.size(), 1u);
  EXPECT_EQ(plugin->call_count(Op::Publish), 2u);
}

TEST(PublishRunnerTest, SessionReportsFinalizeFailure) {
  auto plugin = std::make_shared<pp::ScriptedPlugin>("p");
  plugin->fail_finalize_with({pc::PublishError::FinalizeFailed, "lock held"});
  auto units = make_units(plugin, {"a"});

  auto summary = pa::run_session(units, pa::default_config());
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), pc::PublishError::FinalizeFailed);
}

TEST(PublishRunnerTest, SequentialValidationPropagatesPluginException) {
  auto units = make_throwing_units(4);
  EXPECT_THROW((void)pa::validate_all(units, 1), std::runtime_error);
}

TEST(PublishRunnerTest, ParallelValidationPropagatesPluginException) {
  auto units = make_throwing_units(4);
  try {
    (void)pa::validate_all(units, 4);
    FAIL() << "expected the plugin exception to reach the caller";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "plugin blew up");
  }
}

TEST(PublishRunnerTest, SessionWithWorkersPropagatesPluginException) {
  auto units = make_throwing_units(8);
  pa::SessionConfig cfg = pa::default_config();
  cfg.validate_workers = 4;
  EXPECT_THROW((void)pa::run_session(units, cfg), std::runtime_error);
}
