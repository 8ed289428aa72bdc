#include <gtest/gtest.h>
#include "clinmcp/docstring.hpp"

using namespace clinmcp;

namespace {

const char* kAuditDoc = R"(
    Manages audit findings and tracks CAPA completion status.

    Example:
        Input: List of audit findings with CAPA status and due dates
        Output: CAPA status summary with completion rates

    Parameters:
        findings : list
            List of audit findings with CAPA data
        as_of : str, optional
            Reference date for overdue checks
        threshold : float, optional
            Overdue tolerance in days (default: 2.5)
        strict : bool
            Treat partial CAPAs as open (default: False)
    )";

const ToolParameter* param(const ToolDoc& doc, const std::string& name) {
    for (const auto& p : doc.parameters) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

} // namespace

TEST(DocstringParser, SummaryIsFirstNonEmptyLine) {
    auto doc = DocstringParser::parse(kAuditDoc);
    EXPECT_EQ(doc.summary, "Manages audit findings and tracks CAPA completion status.");
}

TEST(DocstringParser, ExampleBlock) {
    auto doc = DocstringParser::parse(kAuditDoc);
    ASSERT_TRUE(doc.example.has_value());
    EXPECT_EQ(*doc.example,
              "Input: List of audit findings with CAPA status and due dates\n"
              "Output: CAPA status summary with completion rates");
    EXPECT_EQ(*doc.example_input, "List of audit findings with CAPA status and due dates");
    EXPECT_EQ(*doc.example_output, "CAPA status summary with completion rates");
}

TEST(DocstringParser, Parameters) {
    auto doc = DocstringParser::parse(kAuditDoc);
    ASSERT_EQ(doc.parameters.size(), 4u);

    auto* findings = param(doc, "findings");
    ASSERT_NE(findings, nullptr);
    EXPECT_EQ(findings->type, "array");
    EXPECT_TRUE(findings->required);
    EXPECT_EQ(findings->description, "List of audit findings with CAPA data");

    auto* as_of = param(doc, "as_of");
    EXPECT_EQ(as_of->type, "string");
    EXPECT_FALSE(as_of->required);
    EXPECT_FALSE(as_of->default_value.has_value());

    auto* threshold = param(doc, "threshold");
    EXPECT_EQ(threshold->type, "number");
    ASSERT_TRUE(threshold->default_value.has_value());
    EXPECT_DOUBLE_EQ(threshold->default_value->get<double>(), 2.5);
    EXPECT_EQ(threshold->description, "Overdue tolerance in days");

    // A default makes a parameter optional even without the keyword.
    auto* strict = param(doc, "strict");
    EXPECT_FALSE(strict->required);
    EXPECT_EQ(*strict->default_value, false);
}

TEST(DocstringParser, InputSchema) {
    auto doc = DocstringParser::parse(kAuditDoc);
    auto schema = DocstringParser::to_input_schema(doc.parameters);
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["findings"]["type"], "array");
    EXPECT_EQ(schema["properties"]["threshold"]["default"], 2.5);
    EXPECT_EQ(schema["required"], nlohmann::json::array({"findings"}));
}

TEST(DocstringParser, MultiLineDescriptionsAreJoined) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            text : str
                First line
                second line
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_EQ(doc.parameters[0].description, "First line second line");
}

TEST(DocstringParser, OtherSectionEndsParameters) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            a : int
                An integer

        Returns:
            result : dict
                Not a parameter
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_EQ(doc.parameters[0].name, "a");
    EXPECT_EQ(doc.parameters[0].type, "integer");
}

TEST(DocstringParser, MissingParametersGivesPermissiveSchema) {
    auto doc = DocstringParser::parse("Takes a dictionary with a 'text' key and returns it.");
    EXPECT_EQ(doc.summary, "Takes a dictionary with a 'text' key and returns it.");
    EXPECT_TRUE(doc.parameters.empty());
    EXPECT_FALSE(doc.example.has_value());
    EXPECT_EQ(DocstringParser::to_input_schema(doc.parameters), DocstringParser::permissive_schema());
    EXPECT_EQ(DocstringParser::permissive_schema()["additionalProperties"], true);
}

TEST(DocstringParser, MalformedEntriesAreSkipped) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            this line has no separator
                and its description
            good : bool
                Kept
            not a name : str
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_EQ(doc.parameters[0].name, "good");
    EXPECT_EQ(doc.parameters[0].description, "Kept");
}

TEST(DocstringParser, UnknownTypeIsAny) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            payload : SomethingCustom
                Whatever
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_EQ(doc.parameters[0].type, "any");
    auto schema = DocstringParser::to_input_schema(doc.parameters);
    EXPECT_FALSE(schema["properties"]["payload"].contains("type"));
}

TEST(DocstringParser, EmptyDocstring) {
    auto doc = DocstringParser::parse("   \n\n  ");
    EXPECT_TRUE(doc.summary.empty());
    EXPECT_TRUE(doc.parameters.empty());
}

TEST(DocstringParser, MapType) {
    EXPECT_EQ(DocstringParser::map_type("str"), "string");
    EXPECT_EQ(DocstringParser::map_type("int"), "integer");
    EXPECT_EQ(DocstringParser::map_type("float"), "number");
    EXPECT_EQ(DocstringParser::map_type("bool"), "boolean");
    EXPECT_EQ(DocstringParser::map_type("Dict"), "object");
    EXPECT_EQ(DocstringParser::map_type("dict"), "object");
    EXPECT_EQ(DocstringParser::map_type("List[float]"), "array");
    EXPECT_EQ(DocstringParser::map_type("Dict[str, Any]"), "object");
    EXPECT_EQ(DocstringParser::map_type("Optional[int]"), "integer");
    EXPECT_EQ(DocstringParser::map_type("Any"), "any");
    EXPECT_EQ(DocstringParser::map_type(""), "any");
}

TEST(DocstringParser, ParseDefault) {
    EXPECT_EQ(DocstringParser::parse_default("0.05"), 0.05);
    EXPECT_EQ(DocstringParser::parse_default("10"), 10);
    EXPECT_EQ(DocstringParser::parse_default("True"), true);
    EXPECT_EQ(DocstringParser::parse_default("False"), false);
    EXPECT_TRUE(DocstringParser::parse_default("None").is_null());
    EXPECT_EQ(DocstringParser::parse_default("'X'"), "X");
    EXPECT_EQ(DocstringParser::parse_default("\"both\""), "both");
    EXPECT_EQ(DocstringParser::parse_default("standard"), "standard");
}

TEST(DocstringParser, DefaultWithoutColon) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            replacement_char : str
                Character for redaction (default 'X')
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_FALSE(doc.parameters[0].required);
    EXPECT_EQ(*doc.parameters[0].default_value, "X");
}

TEST(DocstringParser, DefaultOnTheTypeLine) {
    auto doc = DocstringParser::parse(R"(
        Summary.

        Parameters:
            alpha : float (default: 0.05)
                Significance level
    )");
    ASSERT_EQ(doc.parameters.size(), 1u);
    EXPECT_EQ(doc.parameters[0].type, "number");
    EXPECT_EQ(*doc.parameters[0].default_value, 0.05);
}
