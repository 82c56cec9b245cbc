#include "Module.h"
#include <gtest/gtest.h>

class TestModule : public sy::Module {
public:
  explicit TestModule(const std::string &name) : sy::Module(name) {}
};

TEST(ModuleTest, LoggerCarriesModuleName) {
  TestModule module("mt_module");
  EXPECT_EQ(module.getLoggerName(), "mt_module");
  EXPECT_EQ(module.log().getName(), "mt_module");
  EXPECT_NO_THROW(module.log().info << "Test message");
}

TEST(ModuleTest, LogIsUsableOnConstModule) {
  const TestModule module("mt_const");
  EXPECT_NO_THROW(module.log().debug << "Const test message");
  EXPECT_EQ(module.log().getName(), "mt_const");
}

TEST(ModuleTest, RedirectLoggerReparents) {
  TestModule parent("mt_parent");
  TestModule child("mt_child");

  child.redirectLogger(parent.log().getFullName());

  EXPECT_EQ(child.log().getParent(), parent.log());
  EXPECT_EQ(child.log().getFullName(), "mt_parent.mt_child");
  EXPECT_EQ(child.getLoggerName(), "mt_child");
}

TEST(ModuleTest, RedirectToSelfThrows) {
  TestModule module("mt_self");
  EXPECT_THROW(module.redirectLogger("mt_self"), std::invalid_argument);
}
