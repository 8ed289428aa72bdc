#include <gtest/gtest.h>
#include "clinmcp/codec.hpp"
#include "clinmcp/error.hpp"
#include <limits>

using namespace clinmcp;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "initialized");
}

TEST(CodecParse, RequestWithParams) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"test_echo","arguments":{"text":"hello"}}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "test_echo");
    EXPECT_EQ(req.params->at("arguments").at("text"), "hello");
}

TEST(CodecParse, NumbersKeepTheirKind) {
    auto j = Codec::parse_json(R"({"i":-3,"u":18446744073709551615,"d":0.25,"b":true,"n":null})");
    EXPECT_TRUE(j["i"].is_number_integer());
    EXPECT_TRUE(j["u"].is_number_unsigned());
    EXPECT_DOUBLE_EQ(j["d"].get<double>(), 0.25);
    EXPECT_TRUE(j["b"].get<bool>());
    EXPECT_TRUE(j["n"].is_null());
}

TEST(CodecParse, ScalarDocument) {
    EXPECT_EQ(Codec::parse_json("42"), 42);
    EXPECT_EQ(Codec::parse_json(R"("text")"), "text");
}

// ---- Error classification ----

TEST(CodecParse, InvalidJsonIsParseError) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, EmptyInputIsParseError) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, TrailingContentIsParseError) {
    EXPECT_THROW(Codec::parse_json(R"({"a":1} {"b":2})"), ParseError);
}

TEST(CodecParse, MissingJsonrpcIsInvalidRequest) {
    try {
        (void)Codec::parse(R"({"id":1,"method":"ping"})");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), ProtocolError);
}

TEST(CodecParse, NullIdRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ProtocolError);
}

TEST(CodecParse, FractionalId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
    const auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_DOUBLE_EQ(std::get<double>(req.id), 1.5);
}

TEST(CodecParse, IdAboveInt64Max) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})");
    const auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<uint64_t>(req.id), std::numeric_limits<uint64_t>::max());

    msg = Codec::parse(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"ping"})");
    EXPECT_EQ(std::get<uint64_t>(std::get<JsonRpcRequest>(msg).id), 9223372036854775808ull);
}

TEST(CodecParse, ObjectIdRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{"n":1},"method":"ping"})"), ProtocolError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ProtocolError);
}

TEST(CodecParse, ScalarParamsRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":5})"), ProtocolError);
}

TEST(CodecParse, ResponseWithResultAndError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"),
                 ProtocolError);
}

// ---- Id salvage ----

TEST(CodecSalvage, FromValidJson) {
    auto id = Codec::salvage_id(R"({"jsonrpc":"1.0","id":9,"method":"ping"})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<int64_t>(*id), 9);
}

TEST(CodecSalvage, FromBrokenJson) {
    auto id = Codec::salvage_id(R"({"jsonrpc":"2.0","id":"req-4","method":)");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<std::string>(*id), "req-4");
}

TEST(CodecSalvage, IntegerFromBrokenJson) {
    auto id = Codec::salvage_id(R"({"id": 12, "method": "tools/call", "params": {)");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<int64_t>(*id), 12);
}

TEST(CodecSalvage, NumbersFromBrokenJson) {
    auto fractional = Codec::salvage_id(R"({"id":2.5,)");
    ASSERT_TRUE(fractional.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*fractional), 2.5);

    auto huge = Codec::salvage_id(R"({"id":18446744073709551615,"method":)");
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(std::get<uint64_t>(*huge), std::numeric_limits<uint64_t>::max());
}

TEST(CodecSalvage, SkipsNestedIds) {
    auto id = Codec::salvage_id(
        R"({"jsonrpc":"2.0","params":{"id":"inner","items":[{"id":3}]},"id":"outer","method":)");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<std::string>(*id), "outer");

    EXPECT_FALSE(Codec::salvage_id(R"({"params":{"id":7},"method":)").has_value());
}

TEST(CodecSalvage, IdLookingStringValueIgnored) {
    auto id = Codec::salvage_id(R"({"method":"id","note":"\"id\": 4","id":5,)");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<int64_t>(*id), 5);
}

TEST(CodecSalvage, NothingToSalvage) {
    EXPECT_FALSE(Codec::salvage_id("not json at all").has_value());
    EXPECT_FALSE(Codec::salvage_id(R"({"id":null})").has_value());
    EXPECT_FALSE(Codec::salvage_id(R"({"id":12)").has_value());
    EXPECT_FALSE(Codec::salvage_id(R"([{"id":1},)").has_value());
}

// ---- Serialize tests ----

TEST(CodecSerialize, RoundTrip) {
    const std::string original = R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"calculate"}})";
    auto msg = Codec::parse(original);
    auto reparsed = Codec::parse(Codec::serialize(msg));
    EXPECT_EQ(msg, reparsed);
}

TEST(CodecSerialize, ResponseWithoutResultCarriesNull) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json{{"text", std::string("a\xff" "b")}});
    std::string out;
    EXPECT_NO_THROW(out = Codec::serialize(resp));
    EXPECT_NE(out.find("\"id\":1"), std::string::npos);
}

// ---- Large message test ----

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 100u);
}
