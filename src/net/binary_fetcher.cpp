#include "net/binary_fetcher.hpp"

#include "io/file_writer.hpp"
#include "io/string_writer.hpp"
#include "util/logger.hpp"

#include <cstdio>

namespace lsmux {

namespace {

bool IsRedirect(long status) { return status == 301 || status == 302; }

} // namespace

std::string BinaryFetcher::ResolveLocation(const std::string& base_url, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;

    const auto scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos) return location;

    if (location.rfind("//", 0) == 0) {
        return base_url.substr(0, scheme_end + 1) + location;
    }

    const auto host_end = base_url.find('/', scheme_end + 3);
    const std::string origin = host_end == std::string::npos ? base_url : base_url.substr(0, host_end);
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }

    std::string dir = host_end == std::string::npos ? origin + "/" : base_url;
    if (const auto q = dir.find_first_of("?#"); q != std::string::npos) dir.erase(q);
    dir.erase(dir.rfind('/') + 1);
    return dir + location;
}

Result BinaryFetcher::Fetch(const std::string& url, const std::string& user_agent, IWriter& sink) const {
    const HttpHeaders headers = {{"User-Agent", user_agent}};
    std::string current = url;

    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        HttpResponse resp;
        auto r = http_.Get(current, headers, sink, cancel_, resp);
        if (!r.is_ok()) return r;

        if (IsRedirect(resp.status)) {
            if (resp.location.empty()) {
                return Result::Fail(ErrorKind::Download,
                                    "redirect without Location from " + current);
            }
            const std::string next = ResolveLocation(current, resp.location);
            LogDebug("redirect %ld: %s -> %s", resp.status, current.c_str(), next.c_str());
            current = next;
            continue;
        }

        if (resp.status != 200) {
            return Result::Fail(ErrorKind::Download, resp.status_text + " (" + current + ")");
        }
        return Result::Ok();
    }

    return Result::Fail(ErrorKind::Download,
                        "too many redirects (>" + std::to_string(kMaxRedirects) + ") for " + url);
}

Result BinaryFetcher::FetchToString(const std::string& url,
                                    const std::string& user_agent,
                                    std::string& out) const {
    StringWriter writer;
    auto r = Fetch(url, user_agent, writer);
    if (!r.is_ok()) return r;
    out = writer.Take();
    return Result::Ok();
}

Result BinaryFetcher::Download(const std::string& url,
                               const std::string& destination_path,
                               const std::string& user_agent) const {
    FileWriter writer;
    auto open_res = FileWriter::Open(destination_path, writer);
    if (!open_res.is_ok()) return open_res;

    LogInfo("Downloading %s -> %s", url.c_str(), destination_path.c_str());

    auto fail = [&](Result r) {
        (void)writer.Close();
        std::remove(destination_path.c_str());
        return r;
    };

    auto r = Fetch(url, user_agent, writer);
    if (!r.is_ok()) return fail(r);

    auto fr = writer.Flush();
    if (!fr.is_ok()) return fail(fr);
    auto cr = writer.Close();
    if (!cr.is_ok()) return fail(cr);

    return Result::Ok();
}

} // namespace lsmux
