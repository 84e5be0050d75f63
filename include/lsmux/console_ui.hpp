#pragma once

#include "lsmux/user_interface.hpp"

#include <cstdio>
#include <string>

namespace lsmux {

// Prompts on the controlling terminal (/dev/tty) so stdin stays free for the
// event stream. With assume_yes the first action is chosen; without a
// terminal prompts are dismissed.
class ConsoleUserInterface final : public IUserInterface {
public:
    explicit ConsoleUserInterface(bool assume_yes);
    ~ConsoleUserInterface() override;

    ConsoleUserInterface(const ConsoleUserInterface&) = delete;
    ConsoleUserInterface& operator=(const ConsoleUserInterface&) = delete;

    std::string ShowInformation(const std::string& message,
                                const std::vector<std::string>& actions) override;
    void ShowError(const std::string& message) override;
    void OpenExternal(const std::string& url) override;
    void ReloadHost() override { reload_requested_ = true; }

    bool ReloadRequested() const { return reload_requested_; }

private:
    bool assume_yes_ = false;
    bool reload_requested_ = false;
    std::FILE* tty_ = nullptr;
};

} // namespace lsmux
