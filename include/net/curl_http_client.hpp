#pragma once

#include "net/http_client.hpp"

namespace lsmux {

class CurlHttpClient final : public IHttpClient {
public:
    struct Options {
        long connect_timeout_sec = 15;
        // Abort when the transfer stays below low_speed_limit bytes/s for
        // low_speed_time seconds. Total time is unbounded for large packages.
        long low_speed_limit = 1;
        long low_speed_time_sec = 60;
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);

    Result Get(const std::string& url,
               const HttpHeaders& headers,
               IWriter& body,
               const CancelToken* cancel,
               HttpResponse& out) override;

private:
    Options opt_{};
};

} // namespace lsmux
