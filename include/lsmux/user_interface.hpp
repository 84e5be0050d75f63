#pragma once

#include <string>
#include <vector>

namespace lsmux {

// Host-facing prompts and notices. Implementations decide how (and whether)
// to ask; the core only reacts to the returned choice.
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    // Returns the chosen action, or an empty string when dismissed.
    virtual std::string ShowInformation(const std::string& message,
                                        const std::vector<std::string>& actions) = 0;
    virtual void ShowError(const std::string& message) = 0;
    virtual void OpenExternal(const std::string& url) = 0;
    virtual void ReloadHost() = 0;
};

} // namespace lsmux
