#pragma once

#include "io/io.hpp"
#include "net/http_client.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <string>

namespace lsmux {

class BinaryFetcher {
public:
    static constexpr int kMaxRedirects = 5;

    explicit BinaryFetcher(IHttpClient& http, const CancelToken* cancel = nullptr)
        : http_(http), cancel_(cancel) {}

    // GET `url`, following 301/302 via Location up to kMaxRedirects hops.
    // Non-200 final responses fail with ErrorKind::Download carrying the status text.
    Result Fetch(const std::string& url, const std::string& user_agent, IWriter& sink) const;

    Result FetchToString(const std::string& url,
                         const std::string& user_agent,
                         std::string& out) const;

    // Streams the body to `destination_path`. A partially written file is
    // removed before an error is returned.
    Result Download(const std::string& url,
                    const std::string& destination_path,
                    const std::string& user_agent) const;

    // Absolute Location values are returned as-is; others are resolved against `base_url`.
    static std::string ResolveLocation(const std::string& base_url, const std::string& location);

private:
    IHttpClient& http_;
    const CancelToken* cancel_ = nullptr;
};

} // namespace lsmux
