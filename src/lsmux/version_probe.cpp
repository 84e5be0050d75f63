#include "lsmux/version_probe.hpp"

#include "process/subprocess.hpp"
#include "util/semver.hpp"

#include <regex>

namespace lsmux {

std::optional<std::string> ExtractVersion(std::string_view text) {
    static const std::regex kVersion(
        R"((\d+\.\d+\.\d+(?:-[0-9A-Za-z.-]+)?(?:\+[0-9A-Za-z.-]+)?))");

    const std::string s(text);
    for (auto it = std::sregex_iterator(s.begin(), s.end(), kVersion); it != std::sregex_iterator(); ++it) {
        std::string candidate = (*it)[1].str();
        // Sentence punctuation gets swallowed by the identifier classes.
        while (!candidate.empty() && (candidate.back() == '.' || candidate.back() == '-' ||
                                      candidate.back() == '+')) {
            candidate.pop_back();
        }
        if (SemanticVersion::Parse(candidate)) return candidate;
    }
    return std::nullopt;
}

Result ExecVersionProbe::Probe(const std::string& binary_path, std::string& out_version) {
    out_version.clear();

    CapturedOutput captured;
    auto r = RunAndCapture(binary_path, {"--version"}, timeout_, captured);
    if (!r.is_ok()) return Result::Fail(ErrorKind::Probe, r.msg);

    if (captured.exit_code != 0) {
        return Result::Fail(ErrorKind::Probe,
                            binary_path + " --version exited with " + std::to_string(captured.exit_code));
    }

    auto version = ExtractVersion(captured.output);
    if (!version) {
        return Result::Fail(ErrorKind::Probe, "no version in output of " + binary_path + " --version");
    }
    out_version = *version;
    return Result::Ok();
}

} // namespace lsmux
