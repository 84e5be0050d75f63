#include <gtest/gtest.h>

#include "process/jsonrpc_connection.hpp"

#include <fcntl.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <vector>

namespace lsmux {
namespace {

using nlohmann::json;

TEST(FrameDecoderTest, DecodesSplitAndBackToBackFrames) {
    const std::string a = EncodeFrame(json{{"id", 1}});
    const std::string b = EncodeFrame(json{{"id", 2}});

    FrameDecoder d;
    d.Append(a.substr(0, 10));
    auto none = d.Next();
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->has_value());

    d.Append(a.substr(10) + b);
    auto first = d.Next();
    ASSERT_TRUE(first.has_value() && first->has_value());
    EXPECT_EQ(json::parse(**first)["id"], 1);

    auto second = d.Next();
    ASSERT_TRUE(second.has_value() && second->has_value());
    EXPECT_EQ(json::parse(**second)["id"], 2);
    EXPECT_EQ(d.Buffered(), 0u);
}

TEST(FrameDecoderTest, IgnoresOtherHeadersAndIsCaseInsensitive) {
    FrameDecoder d;
    d.Append("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\ncontent-length: 2\r\n\r\n{}");
    auto msg = d.Next();
    ASSERT_TRUE(msg.has_value() && msg->has_value());
    EXPECT_EQ(**msg, "{}");
}

TEST(FrameDecoderTest, RejectsMissingOrBadLength) {
    FrameDecoder d;
    d.Append("Content-Type: x\r\n\r\n{}");
    EXPECT_FALSE(d.Next().has_value());

    FrameDecoder e;
    e.Append("Content-Length: 12abc\r\n\r\n{}");
    EXPECT_FALSE(e.Next().has_value());
}

// Plays the server end of two pipes on its own thread.
class FakeServer {
  public:
    FakeServer() {
        int c2s[2];
        int s2c[2];
        if (::pipe2(c2s, O_CLOEXEC) != 0 || ::pipe2(s2c, O_CLOEXEC) != 0) {
            throw std::runtime_error("pipe2 failed");
        }
        client_write_ = c2s[1];
        server_read_ = c2s[0];
        server_write_ = s2c[1];
        client_read_ = s2c[0];
        thread_ = std::thread([this] { Run(); });
    }

    ~FakeServer() {
        CloseClientWrite();
        if (thread_.joinable()) thread_.join();
        CloseServerWrite();
        ::close(server_read_);
        ::close(client_read_);
    }

    int ClientRead() const { return client_read_; }
    int ClientWrite() const { return client_write_; }

    void CloseClientWrite() {
        if (client_write_ >= 0) ::close(client_write_);
        client_write_ = -1;
    }
    void CloseServerWrite() {
        std::lock_guard<std::mutex> lk(mu_);
        if (server_write_ >= 0) ::close(server_write_);
        server_write_ = -1;
    }

    std::vector<json> Received() {
        std::lock_guard<std::mutex> lk(mu_);
        return received_;
    }

  private:
    void Send(const json& j) {
        std::lock_guard<std::mutex> lk(mu_);
        if (server_write_ < 0) return;
        const std::string f = EncodeFrame(j);
        (void)!::write(server_write_, f.data(), f.size());
    }

    void Run() {
        FrameDecoder d;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(server_read_, buf, sizeof(buf))) > 0) {
            d.Append(std::string_view(buf, static_cast<size_t>(n)));
            for (auto next = d.Next(); next && next->has_value(); next = d.Next()) {
                json msg = json::parse(**next);
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    received_.push_back(msg);
                }
                const std::string method = msg.value("method", "");
                if (method == "initialize") {
                    Send({{"jsonrpc", "2.0"}, {"id", "s1"}, {"method", "client/registerCapability"},
                          {"params", {{"registrations", json::array()}}}});
                    Send({{"jsonrpc", "2.0"}, {"method", "window/logMessage"},
                          {"params", {{"type", 3}, {"message", "hello"}}}});
                    Send({{"jsonrpc", "2.0"}, {"id", msg["id"]},
                          {"result", {{"capabilities", {{"hoverProvider", true}}}}}});
                } else if (method == "fail") {
                    Send({{"jsonrpc", "2.0"}, {"id", msg["id"]},
                          {"error", {{"code", -32601}, {"message", "method not found"}}}});
                } else if (method == "shutdown") {
                    Send({{"jsonrpc", "2.0"}, {"id", msg["id"]}, {"result", nullptr}});
                }
            }
        }
    }

    int client_write_ = -1;
    int client_read_ = -1;
    int server_read_ = -1;
    int server_write_ = -1;
    std::mutex mu_;
    std::vector<json> received_;
    std::thread thread_;
};

TEST(JsonRpcConnectionTest, RequestGetsResultAndServerRequestsAreAnswered) {
    FakeServer server;
    JsonRpcConnection conn(server.ClientRead(), server.ClientWrite());
    conn.Start();

    json result;
    auto r = conn.Request("initialize", {{"rootUri", "file:///a/"}}, std::chrono::seconds(5), result);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(result["capabilities"]["hoverProvider"].get<bool>());

    ASSERT_TRUE(conn.Notify("initialized", json::object()).is_ok());
    json ignored;
    ASSERT_TRUE(conn.Request("shutdown", nullptr, std::chrono::seconds(5), ignored).is_ok());
    conn.Close();

    server.CloseClientWrite();
    const auto received = server.Received();
    bool answered_s1 = false;
    bool saw_initialized = false;
    for (const auto& m : received) {
        if (m.contains("id") && m["id"] == "s1" && m.contains("result") && m["result"].is_null()) answered_s1 = true;
        if (m.value("method", "") == "initialized") saw_initialized = true;
    }
    EXPECT_TRUE(answered_s1);
    EXPECT_TRUE(saw_initialized);
}

TEST(JsonRpcConnectionTest, ErrorResponseBecomesProcessError) {
    FakeServer server;
    JsonRpcConnection conn(server.ClientRead(), server.ClientWrite());
    conn.Start();

    json result;
    auto r = conn.Request("fail", json::object(), std::chrono::seconds(5), result);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Process);
    EXPECT_NE(r.msg.find("method not found"), std::string::npos);
}

TEST(JsonRpcConnectionTest, UnansweredRequestTimesOut) {
    FakeServer server;
    JsonRpcConnection conn(server.ClientRead(), server.ClientWrite());
    conn.Start();

    json result;
    auto r = conn.Request("textDocument/hover", json::object(), std::chrono::milliseconds(100), result);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("timeout"), std::string::npos);
}

TEST(JsonRpcConnectionTest, NothingIsWrittenAfterClose) {
    FakeServer server;
    JsonRpcConnection conn(server.ClientRead(), server.ClientWrite());
    conn.Start();
    ASSERT_TRUE(conn.Notify("initialized", json::object()).is_ok());
    conn.Close();

    auto n = conn.Notify("exit", nullptr);
    ASSERT_FALSE(n.is_ok());
    EXPECT_EQ(n.kind, ErrorKind::Process);

    server.CloseClientWrite();
    for (const auto& m : server.Received()) {
        EXPECT_NE(m.value("method", ""), "exit");
    }
}

TEST(JsonRpcConnectionTest, PeerHangupFailsLaterRequests) {
    FakeServer server;
    JsonRpcConnection conn(server.ClientRead(), server.ClientWrite());
    conn.Start();

    server.CloseServerWrite();
    for (int i = 0; i < 100 && conn.Alive(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(conn.Alive());

    json result;
    auto r = conn.Request("initialize", json::object(), std::chrono::seconds(1), result);
    EXPECT_FALSE(r.is_ok());
}

} // namespace
} // namespace lsmux
