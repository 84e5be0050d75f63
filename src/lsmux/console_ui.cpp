#include "lsmux/console_ui.hpp"

#include "lsmux/progress_sinks.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <cstring>

namespace lsmux {

ConsoleUserInterface::ConsoleUserInterface(bool assume_yes) : assume_yes_(assume_yes) {
    if (!assume_yes_) {
        tty_ = std::fopen("/dev/tty", "r+");
    }
}

ConsoleUserInterface::~ConsoleUserInterface() {
    if (tty_) std::fclose(tty_);
}

std::string ConsoleUserInterface::ShowInformation(const std::string& message,
                                                  const std::vector<std::string>& actions) {
    ClearProgressLine();
    if (actions.empty()) {
        std::fprintf(stderr, "%s\n", message.c_str());
        return {};
    }
    if (assume_yes_) {
        std::fprintf(stderr, "%s [%s]\n", message.c_str(), actions.front().c_str());
        return actions.front();
    }
    if (!tty_) {
        LogInfo("%s (no terminal, dismissed)", message.c_str());
        return {};
    }

    std::fprintf(tty_, "%s\n", message.c_str());
    for (size_t i = 0; i < actions.size(); ++i) {
        std::fprintf(tty_, "  %zu) %s\n", i + 1, actions[i].c_str());
    }
    std::fprintf(tty_, "Choice (empty to dismiss): ");
    std::fflush(tty_);

    char line[64]{};
    if (!std::fgets(line, sizeof(line), tty_)) return {};
    const long choice = std::strtol(line, nullptr, 10);
    if (choice < 1 || static_cast<size_t>(choice) > actions.size()) return {};
    return actions[static_cast<size_t>(choice) - 1];
}

void ConsoleUserInterface::ShowError(const std::string& message) {
    ClearProgressLine();
    std::fprintf(stderr, "ERROR: %s\n", message.c_str());
}

void ConsoleUserInterface::OpenExternal(const std::string& url) {
    std::fprintf(stderr, "Open: %s\n", url.c_str());
}

} // namespace lsmux
