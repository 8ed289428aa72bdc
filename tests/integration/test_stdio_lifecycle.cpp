#include <gtest/gtest.h>
#include "clinmcp/catalog.hpp"
#include "clinmcp/discovery.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/framing.hpp"
#include "clinmcp/server.hpp"
#include <unistd.h>
#include <thread>

using namespace clinmcp;

// Runs McpServer::serve on a thread, connected to the test through two pipes.
class StdioLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe(c2s_), 0);
        ASSERT_EQ(pipe(s2c_), 0);
        registry_ = ToolDiscovery().discover(builtin_tool_modules());
    }

    void TearDown() override {
        close_client_output();
        if (server_thread_.joinable()) server_thread_.join();
        for (int fd : {c2s_[0], s2c_[0], s2c_[1]}) ::close(fd);
    }

    void start(McpServer::Options opts = {}) {
        server_ = std::make_unique<McpServer>(std::move(opts), registry_);
        server_thread_ = std::thread([this] {
            StdioTransport transport(c2s_[0], s2c_[1]);
            exit_code_ = server_->serve(transport);
        });
    }

    int join() {
        server_thread_.join();
        return exit_code_;
    }

    void send(const nlohmann::json& msg) {
        writer_.write_frame(msg.dump());
    }

    void send_raw(const std::string& bytes) {
        ASSERT_EQ(::write(c2s_[1], bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    nlohmann::json receive() {
        auto frame = reader_.read_frame();
        if (!frame) throw std::runtime_error("server closed its output");
        return nlohmann::json::parse(*frame);
    }

    nlohmann::json roundtrip(int id, const std::string& method,
                             nlohmann::json params = nlohmann::json::object()) {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}});
        return receive();
    }

    void close_client_output() {
        if (c2s_[1] >= 0) {
            ::close(c2s_[1]);
            c2s_[1] = -1;
        }
    }

    int c2s_[2] = {-1, -1};
    int s2c_[2] = {-1, -1};
    ToolRegistry registry_;
    std::unique_ptr<McpServer> server_;
    std::thread server_thread_;
    int exit_code_ = -1;
    FrameWriter writer_{-1};
    FrameReader reader_{-1};

    void connect_client() {
        writer_ = FrameWriter(c2s_[1]);
        reader_ = FrameReader(s2c_[0]);
    }
};

TEST_F(StdioLifecycleTest, FullLifecycle) {
    McpServer::Options opts;
    opts.server_info = {"clinical-tools", "1.0.0"};
    start(opts);
    connect_client();

    auto init = roundtrip(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                            {"clientInfo", {{"name", "inspector"}, {"version", "0.1"}}}});
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "clinical-tools");
    send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

    auto list = roundtrip(2, "tools/list");
    EXPECT_EQ(list["result"]["tools"].size(), 5u);

    auto echo = roundtrip(3, "tools/call", {{"name", "test_echo"}, {"arguments", {{"text", "Hello"}}}});
    EXPECT_EQ(echo["id"], 3);
    EXPECT_EQ(echo["result"]["structuredContent"]["output"], "Hello");

    auto unknown = roundtrip(4, "tools/call", {{"name", "does_not_exist"}});
    EXPECT_EQ(unknown["error"]["code"], error::MethodNotFound);

    // The session survives the error.
    auto calc = roundtrip(5, "tools/call", {{"name", "calculate"},
                                            {"arguments", {{"operation", "add"}, {"a", 2}, {"b", 3}}}});
    EXPECT_EQ(calc["result"]["structuredContent"]["result"], 5.0);

    auto bye = roundtrip(6, "shutdown");
    EXPECT_TRUE(bye["result"].is_object());
    EXPECT_EQ(join(), 0);
    EXPECT_EQ(server_->state(), SessionState::Closed);
}

TEST_F(StdioLifecycleTest, GatedBeforeInitialize) {
    start();
    connect_client();
    auto resp = roundtrip(1, "tools/call", {{"name", "test_echo"}, {"arguments", {{"text", "x"}}}});
    EXPECT_EQ(resp["error"]["code"], error::NotInitialized);
    close_client_output();
    EXPECT_EQ(join(), 0);
}

TEST_F(StdioLifecycleTest, RepliesInRequestOrder) {
    start();
    connect_client();
    roundtrip(1, "initialize");
    for (int id = 10; id < 20; ++id) {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"method", "ping"}});
    }
    for (int id = 10; id < 20; ++id) {
        EXPECT_EQ(receive()["id"], id);
    }
    close_client_output();
    EXPECT_EQ(join(), 0);
}

TEST_F(StdioLifecycleTest, EndOfStreamIsCleanExit) {
    start();
    connect_client();
    close_client_output();
    EXPECT_EQ(join(), 0);
    EXPECT_EQ(server_->state(), SessionState::Closed);
}

TEST_F(StdioLifecycleTest, GarbageBodyKeepsSessionAlive) {
    start();
    connect_client();
    writer_.write_frame("not json at all");
    auto resp = roundtrip(1, "ping");
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["pong"], true);
    close_client_output();
    EXPECT_EQ(join(), 0);
}

TEST_F(StdioLifecycleTest, FramingErrorEndsSession) {
    start();
    connect_client();
    send_raw("Content-Length: twelve\r\n\r\n{}");
    EXPECT_EQ(join(), 1);
    EXPECT_EQ(server_->state(), SessionState::Closed);
}

TEST_F(StdioLifecycleTest, ExitNotification) {
    start();
    connect_client();
    roundtrip(1, "initialize");
    send({{"jsonrpc", "2.0"}, {"method", "exit"}});
    EXPECT_EQ(join(), 0);
}
