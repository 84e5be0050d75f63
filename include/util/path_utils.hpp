#pragma once

#include <string>
#include <string_view>

namespace lsmux {

// Canonical form of a workspace root key: the URI with exactly one trailing '/'.
inline std::string EnsureTrailingSlash(std::string s) {
    if (s.empty() || s.back() != '/') s.push_back('/');
    return s;
}

// True when `root` (canonical, trailing '/') encloses `uri`.
inline bool IsUnderRoot(std::string_view uri, std::string_view root) {
    if (root.empty()) return false;
    if (uri.size() + 1 == root.size() && root.back() == '/') {
        return root.substr(0, uri.size()) == uri;
    }
    return uri.rfind(root, 0) == 0;
}

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// "file:///a/b" -> "/a/b". Other schemes are returned unchanged.
inline std::string FileUriToPath(std::string_view uri) {
    constexpr std::string_view kScheme = "file://";
    if (uri.rfind(kScheme, 0) == 0) return std::string(uri.substr(kScheme.size()));
    return std::string(uri);
}

// "/a/b" -> "file:///a/b". Inputs that already carry a scheme are kept.
inline std::string PathToFileUri(std::string_view path) {
    if (path.find("://") != std::string_view::npos) return std::string(path);
    return "file://" + std::string(path);
}

} // namespace lsmux
