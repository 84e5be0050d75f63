#include "lsmux/platform.hpp"

#include <algorithm>
#include <cctype>
#include <sys/utsname.h>

namespace lsmux {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// uname machine names -> the short names NormalizePlatform understands.
std::string MachineToArch(std::string_view machine) {
    if (machine == "x86_64" || machine == "amd64") return "x64";
    if (machine == "i386" || machine == "i486" || machine == "i586" || machine == "i686") return "x32";
    if (machine == "aarch64" || machine == "arm64") return "arm64";
    if (machine.rfind("armv", 0) == 0) return "arm";
    return std::string(machine);
}

} // namespace

Platform NormalizePlatform(std::string_view os, std::string_view arch) {
    Platform p{std::string(os), std::string(arch)};
    if (p.os == "win32") p.os = "windows";
    if (p.arch == "x64") {
        p.arch = "amd64";
    } else if (p.arch == "x32") {
        p.arch = "386";
    }
    return p;
}

Platform HostPlatform() {
    struct utsname u{};
    if (::uname(&u) != 0) {
        return NormalizePlatform("linux", "x64");
    }
    return NormalizePlatform(Lower(u.sysname), MachineToArch(u.machine));
}

const BuildArtifact* FindBuild(const Release& release, const Platform& platform) {
    for (const auto& b : release.builds) {
        if (b.os == platform.os && b.arch == platform.arch) return &b;
    }
    return nullptr;
}

} // namespace lsmux
