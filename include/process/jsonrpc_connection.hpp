#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace lsmux {

// "Content-Length: N\r\n\r\n<body>"
std::string EncodeFrame(const nlohmann::json& message);

// Incremental decoder for Content-Length framed messages. Other headers
// (Content-Type) are accepted and ignored.
class FrameDecoder {
public:
    void Append(std::string_view bytes) { buffer_.append(bytes); }

    // A complete body, nullopt when more bytes are needed, or an error for a
    // malformed header block.
    std::expected<std::optional<std::string>, std::string> Next();

    std::size_t Buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
};

// JSON-RPC 2.0 over a pair of pipe descriptors it does not own. A reader thread
// drains the peer's output, completes pending requests and answers server
// requests with a null result.
class JsonRpcConnection {
public:
    JsonRpcConnection(int read_fd, int write_fd) : read_fd_(read_fd), write_fd_(write_fd) {}
    JsonRpcConnection(const JsonRpcConnection&) = delete;
    JsonRpcConnection& operator=(const JsonRpcConnection&) = delete;
    ~JsonRpcConnection();

    void Start();
    // Stops and joins the reader thread. Pending requests fail.
    void Close();

    Result Request(const std::string& method,
                   const nlohmann::json& params,
                   std::chrono::milliseconds timeout,
                   nlohmann::json& result);
    Result Notify(const std::string& method, const nlohmann::json& params);

    // False once the peer closed its output or sent garbage.
    bool Alive() const { return alive_.load(); }

private:
    Result Send(const nlohmann::json& message);
    void ReadLoop();
    void HandleMessage(const nlohmann::json& message);
    void FailPending(const std::string& why);

    int read_fd_;
    int write_fd_;

    std::mutex write_mu_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::int64_t next_id_ = 1;
    std::map<std::int64_t, std::optional<nlohmann::json>> pending_;
    std::string closed_reason_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> alive_{false};
    std::thread reader_;
};

} // namespace lsmux
