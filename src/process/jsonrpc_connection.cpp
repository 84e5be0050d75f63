#include "process/jsonrpc_connection.hpp"

#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace lsmux {

namespace {

constexpr std::string_view kHeaderEnd = "\r\n\r\n";
constexpr std::string_view kContentLength = "content-length:";
constexpr int kPollIntervalMs = 100;

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        char c = s[i];
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c != prefix[i]) return false;
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // namespace

std::string EncodeFrame(const nlohmann::json& message) {
    const std::string body = message.dump();
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::expected<std::optional<std::string>, std::string> FrameDecoder::Next() {
    const auto header_end = buffer_.find(kHeaderEnd);
    if (header_end == std::string::npos) return std::optional<std::string>{};

    std::string_view headers(buffer_.data(), header_end);
    std::optional<std::size_t> length;
    while (!headers.empty()) {
        const auto eol = headers.find("\r\n");
        std::string_view line = headers.substr(0, eol);
        headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + 2);

        if (!StartsWithNoCase(line, kContentLength)) continue;
        const std::string_view value = Trim(line.substr(kContentLength.size()));
        std::size_t n = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            return std::unexpected("invalid Content-Length: " + std::string(value));
        }
        length = n;
    }
    if (!length) return std::unexpected("frame without Content-Length");

    const std::size_t body_start = header_end + kHeaderEnd.size();
    if (buffer_.size() - body_start < *length) return std::optional<std::string>{};

    std::string body = buffer_.substr(body_start, *length);
    buffer_.erase(0, body_start + *length);
    return std::optional<std::string>(std::move(body));
}

JsonRpcConnection::~JsonRpcConnection() {
    Close();
}

void JsonRpcConnection::Start() {
    alive_ = true;
    reader_ = std::thread([this] { ReadLoop(); });
}

void JsonRpcConnection::Close() {
    stop_ = true;
    if (reader_.joinable()) reader_.join();
    FailPending("connection closed");
}

Result JsonRpcConnection::Send(const nlohmann::json& message) {
    const std::string frame = EncodeFrame(message);

    std::lock_guard<std::mutex> lk(write_mu_);
    if (stop_) return Result::Fail(ErrorKind::Process, "connection closed");
    std::size_t off = 0;
    while (off < frame.size()) {
        const ssize_t n = ::write(write_fd_, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Process, std::string("write to server failed: ") + std::strerror(errno));
        }
        off += static_cast<std::size_t>(n);
    }
    return Result::Ok();
}

Result JsonRpcConnection::Request(const std::string& method,
                                  const nlohmann::json& params,
                                  std::chrono::milliseconds timeout,
                                  nlohmann::json& result) {
    std::int64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!alive_) {
            return Result::Fail(ErrorKind::Process,
                                method + ": " + (closed_reason_.empty() ? "not connected" : closed_reason_));
        }
        id = next_id_++;
        pending_[id] = std::nullopt;
    }

    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    if (auto r = Send(msg); !r.is_ok()) {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.erase(id);
        return r;
    }

    std::unique_lock<std::mutex> lk(mu_);
    const bool answered = cv_.wait_for(lk, timeout, [&] {
        auto it = pending_.find(id);
        return it == pending_.end() || it->second.has_value();
    });

    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return Result::Fail(ErrorKind::Process, method + ": " + closed_reason_);
    }
    if (!answered || !it->second) {
        pending_.erase(it);
        return Result::Fail(ErrorKind::Process, method + ": no response within timeout");
    }

    nlohmann::json response = std::move(*it->second);
    pending_.erase(it);

    if (response.contains("error")) {
        const auto& err = response["error"];
        std::string text = err.is_object() ? err.value("message", std::string("unknown error")) : err.dump();
        return Result::Fail(ErrorKind::Process, method + " failed: " + text);
    }
    result = response.contains("result") ? response["result"] : nlohmann::json();
    return Result::Ok();
}

Result JsonRpcConnection::Notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null()) msg["params"] = params;
    return Send(msg);
}

void JsonRpcConnection::ReadLoop() {
    FrameDecoder decoder;
    std::array<char, 8192> buf{};
    std::string reason = "server closed its output";

    while (!stop_) {
        pollfd pfd{read_fd_, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, kPollIntervalMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            reason = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(read_fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            reason = std::string("read failed: ") + std::strerror(errno);
            break;
        }
        if (n == 0) break;

        decoder.Append(std::string_view(buf.data(), static_cast<std::size_t>(n)));
        bool broken = false;
        for (;;) {
            auto next = decoder.Next();
            if (!next) {
                reason = next.error();
                broken = true;
                break;
            }
            if (!next->has_value()) break;

            auto message = nlohmann::json::parse(**next, nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                LogWarn("dropping malformed message from server");
                continue;
            }
            HandleMessage(message);
        }
        if (broken) break;
    }

    if (stop_) reason = "connection closed";
    LogDebug("rpc reader finished: %s", reason.c_str());
    FailPending(reason);
}

void JsonRpcConnection::HandleMessage(const nlohmann::json& message) {
    const bool has_method = message.contains("method") && message["method"].is_string();
    const bool has_id = message.contains("id") && !message["id"].is_null();

    if (has_method) {
        const std::string method = message["method"].get<std::string>();
        if (has_id) {
            // Server-to-client requests (registerCapability, configuration, ...)
            // get an empty answer so the server never waits on us.
            nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", nullptr}};
            if (auto r = Send(reply); !r.is_ok()) {
                LogWarn("cannot answer %s: %s", method.c_str(), r.msg.c_str());
            }
            return;
        }
        if (method == "window/logMessage" || method == "window/showMessage") {
            const auto& params = message.contains("params") ? message["params"] : nlohmann::json();
            if (params.is_object() && params.contains("message") && params["message"].is_string()) {
                LogDebug("server: %s", params["message"].get_ref<const std::string&>().c_str());
            }
        }
        return;
    }

    if (!has_id || !message["id"].is_number_integer()) return;
    const auto id = message["id"].get<std::int64_t>();

    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        LogDebug("response for unknown request id %lld", static_cast<long long>(id));
        return;
    }
    it->second = message;
    cv_.notify_all();
}

void JsonRpcConnection::FailPending(const std::string& why) {
    std::lock_guard<std::mutex> lk(mu_);
    alive_ = false;
    if (closed_reason_.empty()) closed_reason_ = why;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!it->second) {
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    cv_.notify_all();
}

} // namespace lsmux
