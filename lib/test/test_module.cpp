#include "Module.h"
#include <gtest/gtest.h>

class TestModule : public ppi::Module {
public:
    TestModule(const std::string& name) : ppi::Module(name) {}
};

TEST(ModuleTest, LogReturnsLoggerReference) {
    TestModule module("test_module");

    EXPECT_NO_THROW({
        module.log().info << "Test message";
        module.log().debug << "Debug message";
        module.log().warning << "Warning message";
    });

    EXPECT_EQ(module.log().getName(), "test_module");
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("const_test");

    EXPECT_NO_THROW({
        module.log().info << "Const test message";
    });

    EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, RedirectLoggerChangesFullName) {
    TestModule module("redirect_module");
    EXPECT_EQ(module.log().getFullName(), "redirect_module");

    module.redirectLogger("ppi_test");
    EXPECT_EQ(module.log().getName(), "redirect_module");
    EXPECT_EQ(module.log().getFullName(), "ppi_test.redirect_module");

    EXPECT_NO_THROW(module.log().info << "Message via redirect");
}

TEST(ModuleTest, ChildModulesFollowParentRedirect) {
    TestModule parent("parent_module");
    TestModule child("parent_module.child");

    parent.redirectLogger("app_test");
    EXPECT_EQ(child.log().getFullName(), "app_test.parent_module.child");
}
