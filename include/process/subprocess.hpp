#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace lsmux {

class Subprocess {
public:
    struct Options {
        std::string working_dir;
        bool merge_stderr = false; // otherwise stderr is inherited
    };

    // fork/exec `command` (PATH lookup when it has no '/') with pipes on its
    // stdin and stdout. exec failures are reported here, not as exit 127.
    static Result Spawn(const std::string& command,
                        const std::vector<std::string>& args,
                        const Options& opt,
                        Subprocess& out);

    Subprocess() = default;
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;
    // Kills and reaps a child that is still running.
    ~Subprocess();

    pid_t Pid() const { return pid_; }
    int StdinFd() const { return stdin_.Get(); }
    int StdoutFd() const { return stdout_.Get(); }
    void CloseStdin() { stdin_.Close(); }

    bool Running();
    // True once the child exited within `timeout`; `exit_code` is -1 when it died by signal.
    bool WaitFor(std::chrono::milliseconds timeout, int* exit_code = nullptr);
    // SIGTERM, then SIGKILL after `grace`. Always reaps.
    Result Terminate(std::chrono::milliseconds grace);

private:
    bool Reap(bool block);
    void Cleanup();

    pid_t pid_ = -1;
    Fd stdin_;
    Fd stdout_;
    bool exited_ = false;
    int exit_code_ = -1;
};

struct CapturedOutput {
    int exit_code = -1;
    std::string output; // stdout and stderr interleaved
};

// Runs to completion with stdin closed. A child still running after
// `timeout` is killed and reported as ErrorKind::Process.
Result RunAndCapture(const std::string& command,
                     const std::vector<std::string>& args,
                     std::chrono::milliseconds timeout,
                     CapturedOutput& out);

} // namespace lsmux
