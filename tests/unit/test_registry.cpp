#include <gtest/gtest.h>
#include "clinmcp/registry.hpp"

using namespace clinmcp;

namespace {

ToolDescriptor make_tool(const std::string& name, const std::string& description = "") {
    ToolDescriptor d;
    d.name = name;
    d.description = description.empty() ? "Tool: " + name : description;
    d.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    d.handler = [name](const nlohmann::json&) { return nlohmann::json{{"from", name}}; };
    return d;
}

} // namespace

TEST(ToolRegistry, EmptyByDefault) {
    ToolRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find("anything"), nullptr);
    EXPECT_TRUE(registry.list().is_array());
    EXPECT_TRUE(registry.list().empty());
}

TEST(ToolRegistry, BuildAndFind) {
    ToolRegistry::Builder builder;
    EXPECT_TRUE(builder.add(make_tool("alpha")));
    EXPECT_TRUE(builder.add(make_tool("beta")));
    ToolRegistry registry = std::move(builder).build();

    ASSERT_EQ(registry.size(), 2u);
    const ToolDescriptor* beta = registry.find("beta");
    ASSERT_NE(beta, nullptr);
    EXPECT_EQ(beta->handler(nlohmann::json::object())["from"], "beta");
    EXPECT_TRUE(registry.contains("alpha"));
    EXPECT_FALSE(registry.contains("gamma"));
}

TEST(ToolRegistry, LookupIsCaseSensitive) {
    ToolRegistry::Builder builder;
    builder.add(make_tool("test_echo"));
    ToolRegistry registry = std::move(builder).build();
    EXPECT_FALSE(registry.contains("Test_Echo"));
}

TEST(ToolRegistry, DuplicateKeepsFirst) {
    ToolRegistry::Builder builder;
    EXPECT_TRUE(builder.add(make_tool("alpha", "first")));
    EXPECT_FALSE(builder.add(make_tool("alpha", "second")));
    EXPECT_EQ(builder.size(), 1u);
    ToolRegistry registry = std::move(builder).build();
    EXPECT_EQ(registry.find("alpha")->description, "first");
}

TEST(ToolRegistry, ListPreservesRegistrationOrder) {
    ToolRegistry::Builder builder;
    builder.add(make_tool("zeta"));
    builder.add(make_tool("alpha"));
    ToolRegistry registry = std::move(builder).build();

    auto list = registry.list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["name"], "zeta");
    EXPECT_EQ(list[1]["name"], "alpha");
    EXPECT_TRUE(list[0].contains("inputSchema"));
    EXPECT_FALSE(list[0].contains("example"));
}

TEST(ToolRegistry, ListIncludesExample) {
    auto tool = make_tool("documented");
    tool.example = "Input: x\nOutput: y";
    ToolRegistry::Builder builder;
    builder.add(std::move(tool));
    ToolRegistry registry = std::move(builder).build();
    EXPECT_EQ(registry.list()[0]["example"], "Input: x\nOutput: y");
}

TEST(ToolRegistry, MoveKeepsIndex) {
    ToolRegistry::Builder builder;
    builder.add(make_tool("alpha"));
    ToolRegistry first = std::move(builder).build();
    ToolRegistry second = std::move(first);
    ASSERT_NE(second.find("alpha"), nullptr);
    EXPECT_EQ(second.find("alpha")->name, "alpha");
}
