// signals.cpp - Signal handling bound to a cancellation token.

#include "system/signals.hpp"

#include <csignal>

namespace lsmux {

namespace {
CancelToken* g_token = nullptr;

void HandleSignal(int) {
    if (g_token) g_token->Cancel();
}
} // namespace

void InstallSignalHandlers(CancelToken* token) {
    g_token = token;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace lsmux
