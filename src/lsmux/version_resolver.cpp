#include "lsmux/version_resolver.hpp"

#include "lsmux/release_index_parser.hpp"
#include "util/logger.hpp"

namespace lsmux {

Result VersionResolver::SelectLatest(const ReleaseIndex& index, Release& out) {
    const Release* best = nullptr;
    for (const auto& [key, release] : index) {
        if (!best || VersionComparator::Compare(best->version, release.version) < 0) {
            best = &release;
        }
    }
    if (!best) return Result::Fail(ErrorKind::NoReleases, "release index lists no versions");
    out = *best;
    return Result::Ok();
}

Result VersionResolver::ResolveLatest(const std::string& user_agent, Release& out) const {
    const std::string url = IndexUrl();

    std::string body;
    auto fr = fetcher_.FetchToString(url, user_agent, body);
    if (!fr.is_ok()) {
        if (fr.kind == ErrorKind::Cancelled) return fr;
        return Result::Fail(ErrorKind::Network, "cannot fetch release index: " + fr.msg);
    }

    auto parsed = ReleaseIndexParser{}.Parse(body);
    if (!parsed) {
        return Result::Fail(ErrorKind::Network, "invalid release index " + url + ": " + parsed.error());
    }

    auto sr = SelectLatest(*parsed, out);
    if (!sr.is_ok()) return sr;

    LogInfo("Latest release: %s (%zu candidates)", out.version_text.c_str(), parsed->size());
    return Result::Ok();
}

} // namespace lsmux
