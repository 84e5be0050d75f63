#include "net/curl_http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string_view>

namespace lsmux {

namespace {

std::once_flag g_curl_init;

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

struct TransferCtx {
    IWriter* body = nullptr;
    const CancelToken* cancel = nullptr;
    HttpResponse* response = nullptr;
    Result write_error = Result::Ok();
};

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Parses "HTTP/1.1 302 Found". A new status line resets the response, so
// interim 1xx responses don't leak into the final one.
bool ParseStatusLine(std::string_view line, HttpResponse& out) {
    if (!StartsWithNoCase(line, "HTTP/")) return false;
    const auto sp = line.find(' ');
    if (sp == std::string_view::npos) return false;
    std::string_view rest = line.substr(sp + 1);
    const auto sp2 = rest.find(' ');
    const std::string code(rest.substr(0, sp2));
    out.status = std::strtol(code.c_str(), nullptr, 10);
    out.status_text = sp2 == std::string_view::npos ? std::string() : std::string(Trim(rest.substr(sp2 + 1)));
    if (out.status_text.empty()) out.status_text = "HTTP " + code;
    out.location.clear();
    return true;
}

size_t HeaderCb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nitems;
    const std::string_view line = Trim(std::string_view(buffer, n));

    if (ParseStatusLine(line, *ctx->response)) return n;
    if (StartsWithNoCase(line, "location:")) {
        ctx->response->location = std::string(Trim(line.substr(9)));
    }
    return n;
}

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;
    if (ctx->response->status != 200) return n;

    auto wr = ctx->body->WriteAll(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), n));
    if (!wr.is_ok()) {
        ctx->write_error = wr;
        return 0;
    }
    return n;
}

int XferInfoCb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    return IsCancelled(ctx->cancel) ? 1 : 0;
}

} // namespace

CurlHttpClient::CurlHttpClient() = default;

CurlHttpClient::CurlHttpClient(Options opt) : opt_(opt) {}

Result CurlHttpClient::Get(const std::string& url,
                           const HttpHeaders& headers,
                           IWriter& body,
                           const CancelToken* cancel,
                           HttpResponse& out) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    out = HttpResponse{};
    if (IsCancelled(cancel)) return Result::Fail(ErrorKind::Cancelled, "request cancelled: " + url);

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorKind::Network, "curl_easy_init failed");

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_headers);
            return Result::Fail(ErrorKind::Network, "curl_slist_append failed");
        }
        raw_headers = appended;
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_headers);

    TransferCtx ctx;
    ctx.body = &body;
    ctx.cancel = cancel;
    ctx.response = &out;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, HeaderCb);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, opt_.low_speed_limit);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, opt_.low_speed_time_sec);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(h);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return Result::Fail(ErrorKind::Cancelled, "request cancelled: " + url);
    }
    if (rc == CURLE_WRITE_ERROR && !ctx.write_error.is_ok()) {
        return ctx.write_error;
    }
    if (rc != CURLE_OK) {
        return Result::Fail(ErrorKind::Network,
                            "GET " + url + " failed: " + curl_easy_strerror(rc));
    }

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    if (code != 0) out.status = code;
    if (out.status_text.empty()) out.status_text = "HTTP " + std::to_string(out.status);

    LogDebug("GET %s -> %ld %s", url.c_str(), out.status, out.status_text.c_str());
    return Result::Ok();
}

} // namespace lsmux
