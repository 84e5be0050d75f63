#include "lsmux/progress_sinks.hpp"

#include <cstdio>

namespace lsmux {

namespace {
bool g_progress_line_active = false;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::uint32_t pct = e.percent > 100 ? 100 : e.percent;

    std::fprintf(stderr,
                 "\r%.*s: %-8.*s %3u%%",
                 (int)e.title.size(),
                 e.title.data(),
                 (int)e.stage.size(),
                 e.stage.data(),
                 pct);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace lsmux
