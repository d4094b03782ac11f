#include <pubflow/core/item.hpp>
#include <pubflow/core/plugin.hpp>
#include <pubflow/core/task_registry.hpp>
#include <pubflow/core/work_unit.hpp>
#include <pubflow/plugins/scripted_plugin.hpp>
#include <gtest/gtest.h>
#include <memory>

namespace pc = pubflow::core;

namespace {

std::shared_ptr<pc::WorkUnit> make_unit(const std::string& item_name) {
  auto unit = pc::WorkUnit::create(
      std::make_shared<pubflow::plugins::ScriptedPlugin>("p"),
      std::make_shared<pc::Item>(item_name), {});
  EXPECT_TRUE(unit.has_value());
  return unit ? *unit : nullptr;
}

}  // namespace

TEST(TaskRegistryTest, AddKeepsOrder) {
  pc::TaskRegistry registry;
  auto a = make_unit("a");
  auto b = make_unit("b");
  ASSERT_TRUE(registry.add(a).has_value());
  ASSERT_TRUE(registry.add(b).has_value());
  auto units = registry.units();
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0], a);
  EXPECT_EQ(units[1], b);
}

TEST(TaskRegistryTest, RejectsNullAndDuplicates) {
  pc::TaskRegistry registry;
  auto a = make_unit("a");
  auto null_result = registry.add(nullptr);
  ASSERT_FALSE(null_result.has_value());
  EXPECT_EQ(null_result.error(), pc::PublishError::InvalidArgument);

  ASSERT_TRUE(registry.add(a).has_value());
  auto dup = registry.add(a);
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), pc::PublishError::DuplicateRegistration);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(TaskRegistryTest, RemoveAndExpiry) {
  pc::TaskRegistry registry;
  auto a = make_unit("a");
  auto b = make_unit("b");
  ASSERT_TRUE(registry.add(a).has_value());
  ASSERT_TRUE(registry.add(b).has_value());

  EXPECT_TRUE(registry.remove(*a));
  EXPECT_FALSE(registry.remove(*a));
  EXPECT_FALSE(registry.contains(*a));
  EXPECT_TRUE(registry.contains(*b));

  b.reset();
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_TRUE(registry.units().empty());
}

TEST(TaskRegistryTest, PluginRejectsSecondRegistrationOfSameUnit) {
  auto plugin = std::make_shared<pubflow::plugins::ScriptedPlugin>("p");
  auto unit = pc::WorkUnit::create(plugin, std::make_shared<pc::Item>("a"), {});
  ASSERT_TRUE(unit.has_value());
  auto again = plugin->add_task(*unit);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), pc::PublishError::DuplicateRegistration);
  EXPECT_EQ(plugin->tasks().size(), 1u);
}
