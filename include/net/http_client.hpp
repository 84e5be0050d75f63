#pragma once

#include "io/io.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace lsmux {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status = 0;
    std::string status_text; // reason phrase, "HTTP <code>" when the server sends none
    std::string location;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Issues exactly one GET; redirects are reported, never followed. The body
    // reaches `body` only for a 200 response. Any HTTP status is a completed
    // exchange (Ok); transport failures are ErrorKind::Network and a raised
    // `cancel` is ErrorKind::Cancelled.
    virtual Result Get(const std::string& url,
                       const HttpHeaders& headers,
                       IWriter& body,
                       const CancelToken* cancel,
                       HttpResponse& out) = 0;
};

} // namespace lsmux
