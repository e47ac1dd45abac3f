/**
 * @file test_registry.cpp
 * @brief Tests for the service registry
 */

#include <gtest/gtest.h>

#include <cstdint>

#include "shortcut/Errors.hpp"
#include "shortcut/Registry.hpp"

using namespace shortcut;

TEST(ServiceRegistry, PropertiesAndNames) {
    ServiceRegistry registry;
    registry.register_bean("routes", {{"timeout", 30}, {"host", "example.org"}});
    registry.register_bean("auth");

    EXPECT_TRUE(registry.contains("routes"));
    EXPECT_FALSE(registry.contains("missing"));
    EXPECT_EQ(registry.property("routes", "timeout"), 30);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"auth", "routes"}));
}

TEST(ServiceRegistry, MissingBeanOrProperty) {
    ServiceRegistry registry;
    registry.register_bean("routes", {{"timeout", 30}});

    EXPECT_THROW(registry.bean("nope"), ExpressionEvaluationError);
    EXPECT_THROW(registry.property("routes", "retries"), ExpressionEvaluationError);
}

TEST(ServiceRegistry, RegisteredMethodReceivesArguments) {
    ServiceRegistry registry;
    registry.register_method("math", "add", [](const std::vector<Value>& args) {
        return Value(args.at(0).get<int64_t>() + args.at(1).get<int64_t>());
    });

    EXPECT_EQ(registry.invoke("math", "add", {Value(2), Value(3)}), 5);
}

TEST(ServiceRegistry, GetterFallsBackToProperty) {
    ServiceRegistry registry;
    registry.register_bean("myBean", {{"value", "v1"}, {"enabled", true}});

    EXPECT_EQ(registry.invoke("myBean", "getValue", {}), "v1");
    EXPECT_EQ(registry.invoke("myBean", "isEnabled", {}), true);
    EXPECT_THROW(registry.invoke("myBean", "getValue", {Value(1)}), ExpressionEvaluationError);
    EXPECT_THROW(registry.invoke("myBean", "value", {}), ExpressionEvaluationError);
    EXPECT_THROW(registry.invoke("myBean", "getMissing", {}), ExpressionEvaluationError);
}

TEST(ServiceRegistry, MethodWinsOverGetter) {
    ServiceRegistry registry;
    registry.register_bean("myBean", {{"value", "property"}});
    registry.register_method("myBean", "getValue", [](const std::vector<Value>&) {
        return Value("method");
    });

    EXPECT_EQ(registry.invoke("myBean", "getValue", {}), "method");
}

TEST(LoadRegistry, BeansSection) {
    Value doc = {{"beans", {{"myBean", {{"value", 7}}}, {"other", Value::object()}}}};
    ServiceRegistry registry = load_registry(doc);

    EXPECT_TRUE(registry.contains("myBean"));
    EXPECT_TRUE(registry.contains("other"));
    EXPECT_EQ(registry.invoke("myBean", "getValue", {}), 7);
}

TEST(LoadRegistry, NoBeansIsEmpty) {
    EXPECT_TRUE(load_registry(Value::object()).names().empty());
}

TEST(LoadRegistry, BeansMustBeObject) {
    Value doc = {{"beans", {1, 2}}};
    EXPECT_THROW(load_registry(doc), ConfigurationError);
}
