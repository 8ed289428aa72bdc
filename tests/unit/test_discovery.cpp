#include <gtest/gtest.h>
#include "clinmcp/discovery.hpp"
#include "clinmcp/error.hpp"
#include <stdexcept>

using namespace clinmcp;

namespace {

ToolModule make_module(const std::string& stem, const std::string& doc = "Does a thing.") {
    ToolModule m;
    m.stem = stem;
    m.docstring = doc;
    m.load = [stem]() -> ToolEntryPoint {
        return [stem](const nlohmann::json&) { return nlohmann::json{{"tool", stem}}; };
    };
    return m;
}

ToolModule broken_module(const std::string& stem) {
    ToolModule m;
    m.stem = stem;
    m.load = []() -> ToolEntryPoint { throw std::runtime_error("syntax error in module"); };
    return m;
}

} // namespace

TEST(ToolDiscovery, FailingModuleIsSkipped) {
    std::vector<ToolModule> modules;
    for (int i = 0; i < 9; ++i) modules.push_back(make_module("tool_" + std::to_string(i)));
    modules.push_back(broken_module("broken_tool"));

    DiscoveryReport report;
    ToolRegistry registry = ToolDiscovery().discover(modules, &report);

    EXPECT_EQ(registry.size(), 9u);
    EXPECT_FALSE(registry.contains("broken_tool"));
    EXPECT_EQ(report.loaded.size(), 9u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].module, "broken_tool");
    EXPECT_EQ(report.skipped[0].reason, "syntax error in module");
}

TEST(ToolDiscovery, ModuleWithoutEntryPointIsSkipped) {
    ToolModule empty;
    empty.stem = "helpers";
    empty.load = []() { return ToolEntryPoint{}; };

    DiscoveryReport report;
    ToolRegistry registry = ToolDiscovery().discover({make_module("real"), empty}, &report);
    EXPECT_EQ(registry.size(), 1u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].reason, "module has no entry point");
}

TEST(ToolDiscovery, DuplicateNamesKeepFirst) {
    std::vector<ToolModule> modules = {make_module("Sample-Tool", "First."), make_module("sample_tool", "Second.")};
    DiscoveryReport report;
    ToolRegistry registry = ToolDiscovery().discover(modules, &report);
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("sample_tool")->description, "First.");
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].module, "sample_tool");
}

TEST(ToolDiscovery, IncludeAndExclude) {
    std::vector<ToolModule> modules = {make_module("a"), make_module("b"), make_module("c")};

    ToolDiscovery::Options only_ab;
    only_ab.include = {"a", "b"};
    EXPECT_EQ(ToolDiscovery(only_ab).discover(modules).size(), 2u);

    ToolDiscovery::Options not_b;
    not_b.exclude = {"b"};
    ToolRegistry registry = ToolDiscovery(not_b).discover(modules);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FALSE(registry.contains("b"));
}

TEST(ToolDiscovery, NormalizeName) {
    EXPECT_EQ(ToolDiscovery::normalize_name("test_echo"), "test_echo");
    EXPECT_EQ(ToolDiscovery::normalize_name("Sample-Size Calculator.v2"), "sample_size_calculator_v2");
}

TEST(ToolDiscovery, DescribeUsesDocstring) {
    auto m = make_module("redactor", R"(
        Redacts things.

        Example:
            Input: text
            Output: less text

        Parameters:
            text : str
                Text to redact
    )");
    ToolDescriptor d = ToolDiscovery::describe(m);
    EXPECT_EQ(d.name, "redactor");
    EXPECT_EQ(d.description, "Redacts things.");
    ASSERT_TRUE(d.example.has_value());
    EXPECT_EQ(d.input_schema["required"], nlohmann::json::array({"text"}));
    ASSERT_EQ(d.parameters.size(), 1u);
}

TEST(ToolDiscovery, DescribeFallsBackWithoutDocumentation) {
    ToolDescriptor d = ToolDiscovery::describe(make_module("bare", ""));
    EXPECT_EQ(d.description, "Tool: bare");
    EXPECT_FALSE(d.example.has_value());
    EXPECT_EQ(d.input_schema["additionalProperties"], true);
}

TEST(ToolDiscovery, ExplicitSchemaWins) {
    auto m = make_module("calc", "Calculates.\n\nParameters:\n    x : int\n        ignored\n");
    m.input_schema = nlohmann::json{{"type", "object"},
                                    {"properties", {{"a", {{"type", "number"}}}}},
                                    {"required", {"a"}}};
    ToolDescriptor d = ToolDiscovery::describe(m);
    EXPECT_EQ(d.input_schema, *m.input_schema);
}

TEST(ToolDiscovery, DescribeWithoutLoaderThrows) {
    ToolModule m;
    m.stem = "nothing";
    EXPECT_THROW(ToolDiscovery::describe(m), Error);
}
