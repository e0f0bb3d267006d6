#include <gtest/gtest.h>

#include <memory>

#include "object_model.hpp"
#include "value.hpp"

class EnvironmentTest : public ::testing::Test {
   protected:
    void SetUp() override {
        global_object = std::make_shared<ObjectValue>();
        global = std::make_shared<Environment>(nullptr, global_object);
    }

    ObjectPtr global_object;
    EnvPtr global;
};

TEST_F(EnvironmentTest, LookupWalksParentChain) {
    auto outer = std::make_shared<Environment>(global);
    auto inner = std::make_shared<Environment>(outer);
    outer->declare("x", 10.0);

    auto v = inner->lookup("x");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*v), 10.0);
    EXPECT_TRUE(inner->has("x"));
    EXPECT_FALSE(inner->has_own("x"));
    EXPECT_FALSE(inner->lookup("missing").has_value());
}

TEST_F(EnvironmentTest, InnerDeclarationShadowsOuter) {
    auto outer = std::make_shared<Environment>(global);
    auto inner = std::make_shared<Environment>(outer);
    outer->declare("x", 1.0);
    inner->declare("x", 2.0);

    EXPECT_DOUBLE_EQ(std::get<double>(*inner->lookup("x")), 2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(*outer->lookup("x")), 1.0);
}

TEST_F(EnvironmentTest, AssignUpdatesNearestBinding) {
    auto outer = std::make_shared<Environment>(global);
    auto inner = std::make_shared<Environment>(outer);
    outer->declare("count", 0.0);

    EXPECT_EQ(inner->assign("count", 5.0), Environment::AssignResult::Ok);
    EXPECT_DOUBLE_EQ(std::get<double>(*outer->lookup("count")), 5.0);
    EXPECT_FALSE(inner->has_own("count"));
}

TEST_F(EnvironmentTest, AssignNeverCreatesBindings) {
    auto scope = std::make_shared<Environment>(global);
    EXPECT_EQ(scope->assign("ghost", 1.0), Environment::AssignResult::NotFound);
    EXPECT_FALSE(scope->has("ghost"));
}

TEST_F(EnvironmentTest, ConstantsRejectAssignment) {
    auto scope = std::make_shared<Environment>(global);
    scope->declare("limit", 3.0, true);

    EXPECT_EQ(scope->assign("limit", 4.0), Environment::AssignResult::Constant);
    EXPECT_DOUBLE_EQ(std::get<double>(*scope->lookup("limit")), 3.0);
}

TEST_F(EnvironmentTest, DeclareVarKeepsExistingValue) {
    auto scope = std::make_shared<Environment>(global);
    scope->declare("v", std::string("kept"));
    scope->declare_var("v");
    EXPECT_EQ(std::get<std::string>(*scope->lookup("v")), "kept");

    scope->declare_var("fresh");
    auto fresh = scope->lookup("fresh");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_TRUE(is_undefined(*fresh));
}

TEST_F(EnvironmentTest, GlobalVarsLiveOnTheGlobalObject) {
    global->declare_var("counter");
    global->assign("counter", 7.0);

    auto prop = get_property(global_object, "counter");
    ASSERT_TRUE(prop.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*prop), 7.0);
}

TEST_F(EnvironmentTest, GlobalObjectPropertiesAreBindings) {
    set_property(global_object, "hostValue", 42.0);

    auto scope = std::make_shared<Environment>(global);
    EXPECT_TRUE(scope->has("hostValue"));
    EXPECT_DOUBLE_EQ(std::get<double>(*scope->lookup("hostValue")), 42.0);
    EXPECT_EQ(scope->assign("hostValue", 43.0), Environment::AssignResult::Ok);
    EXPECT_DOUBLE_EQ(std::get<double>(*get_property(global_object, "hostValue")), 43.0);
}

TEST_F(EnvironmentTest, GlobalConstantsStayOffTheGlobalObject) {
    global->declare("PI_ISH", 3.0, true);

    EXPECT_FALSE(has_own_property(global_object, "PI_ISH"));
    EXPECT_EQ(global->assign("PI_ISH", 4.0), Environment::AssignResult::Constant);
}
