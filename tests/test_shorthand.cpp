/**
 * @file test_shorthand.cpp
 * @brief Tests for shorthand tokenizing and placeholder naming
 */

#include <gtest/gtest.h>

#include "shortcut/Catalog.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Expression.hpp"
#include "shortcut/Normalizer.hpp"
#include "shortcut/Shorthand.hpp"

#include <stdexcept>
#include <vector>

using namespace shortcut;

TEST(GeneratedName, PrefixAndIndex) {
    EXPECT_EQ(generate_name(0), "_genkey_0");
    EXPECT_EQ(generate_name(12), "_genkey_12");
    EXPECT_TRUE(is_generated_name("_genkey_3"));
    EXPECT_FALSE(is_generated_name("name"));
    EXPECT_FALSE(is_generated_name("genkey_0"));
}

TEST(ParseShorthand, NameAndPositionalArgs) {
    auto def = parse_shorthand("Cookie=MyCookie, MyValue");
    EXPECT_EQ(def.name, "Cookie");
    ASSERT_EQ(def.args.size(), 2u);

    auto it = def.args.begin();
    EXPECT_EQ(it->first, "_genkey_0");
    EXPECT_EQ(*it->second, "MyCookie");
    ++it;
    EXPECT_EQ(it->first, "_genkey_1");
    EXPECT_EQ(*it->second, "MyValue");
}

TEST(ParseShorthand, EmptyTokensDropped) {
    auto def = parse_shorthand("Method=GET,,POST,");
    ASSERT_EQ(def.args.size(), 2u);
    EXPECT_EQ(*def.args.at("_genkey_0"), "GET");
    EXPECT_EQ(*def.args.at("_genkey_1"), "POST");
}

TEST(ParseShorthand, NoArguments) {
    auto def = parse_shorthand("SaveSession=");
    EXPECT_EQ(def.name, "SaveSession");
    EXPECT_TRUE(def.args.empty());
}

TEST(ParseShorthand, OnlyFirstEqualsSplits) {
    auto def = parse_shorthand("Query=foo=bar");
    EXPECT_EQ(def.name, "Query");
    ASSERT_EQ(def.args.size(), 1u);
    EXPECT_EQ(*def.args.at("_genkey_0"), "foo=bar");
}

TEST(ParseShorthand, MissingEqualsThrows) {
    EXPECT_THROW(parse_shorthand("Cookie"), ConfigurationError);
    EXPECT_THROW(parse_shorthand("=value"), ConfigurationError);
    EXPECT_THROW(parse_shorthand(""), ConfigurationError);
}

TEST(ParseShorthand, FeedsNormalizer) {
    auto def = parse_shorthand("Path=/red/**,/blue/**,true");
    TemplateExpressionResolver resolver;
    ServiceRegistry registry;
    auto out = normalize(def.args, HintCatalog::builtin().at(def.name), resolver, registry);

    EXPECT_EQ(out["patterns"], (Value{"/red/**", "/blue/**"}));
    EXPECT_EQ(out["matchTrailingSlash"], "true");
}

TEST(ArgMap, AssignReplacesInPlace) {
    ArgMap args;
    args["_genkey_0"] = std::string("a");
    args["name"] = std::string("b");
    args["_genkey_0"] = std::string("c");
    args["z"] = std::nullopt;

    ASSERT_EQ(args.size(), 3u);
    auto it = args.begin();
    EXPECT_EQ(it->first, "_genkey_0");
    EXPECT_EQ(*it->second, "c");
    ++it;
    EXPECT_EQ(it->first, "name");
    ++it;
    EXPECT_EQ(it->first, "z");
    EXPECT_FALSE(it->second.has_value());

    EXPECT_EQ(args.count("name"), 1u);
    EXPECT_THROW(args.at("missing"), std::out_of_range);
}

TEST(ArgMap, ParsedArgsKeepDeclarationOrder) {
    auto args = parse_shorthand_args("c,b,a");
    std::vector<std::string> keys;
    for (const auto& [key, value] : args) keys.push_back(key);
    EXPECT_EQ(keys, (std::vector<std::string>{"_genkey_0", "_genkey_1", "_genkey_2"}));
    EXPECT_EQ(*args.at("_genkey_0"), "c");
}
