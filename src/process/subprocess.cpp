#include "process/subprocess.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace lsmux {

namespace {

using Clock = std::chrono::steady_clock;

struct Pipe {
    Fd read;
    Fd write;
};

Result MakePipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Result::Fail(ErrorKind::Process, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    p.read.Reset(fds[0]);
    p.write.Reset(fds[1]);
    return Result::Ok();
}

[[noreturn]] void ChildExec(const std::string& command,
                            const std::vector<std::string>& args,
                            const Subprocess::Options& opt,
                            int stdin_fd,
                            int stdout_fd,
                            int err_fd) {
    auto report = [err_fd](int err) {
        (void)!::write(err_fd, &err, sizeof(err));
        _exit(127);
    };

    if (::dup2(stdin_fd, STDIN_FILENO) < 0) report(errno);
    if (::dup2(stdout_fd, STDOUT_FILENO) < 0) report(errno);
    if (opt.merge_stderr && ::dup2(stdout_fd, STDERR_FILENO) < 0) report(errno);
    if (!opt.working_dir.empty() && ::chdir(opt.working_dir.c_str()) != 0) report(errno);

    std::signal(SIGPIPE, SIG_DFL);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(command.c_str(), argv.data());
    report(errno);
    _exit(127);
}

} // namespace

Result Subprocess::Spawn(const std::string& command,
                         const std::vector<std::string>& args,
                         const Options& opt,
                         Subprocess& out) {
    Pipe in_pipe, out_pipe, err_pipe;
    if (auto r = MakePipe(in_pipe); !r.is_ok()) return r;
    if (auto r = MakePipe(out_pipe); !r.is_ok()) return r;
    if (auto r = MakePipe(err_pipe); !r.is_ok()) return r;

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(ErrorKind::Process, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ChildExec(command, args, opt, in_pipe.read.Get(), out_pipe.write.Get(), err_pipe.write.Get());
    }

    in_pipe.read.Close();
    out_pipe.write.Close();
    err_pipe.write.Close();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe.read.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        (void)::waitpid(pid, &status, 0);
        return Result::Fail(ErrorKind::Process,
                            "cannot execute " + command + ": " + std::strerror(child_errno));
    }

    out.Cleanup();
    out.pid_ = pid;
    out.stdin_ = std::move(in_pipe.write);
    out.stdout_ = std::move(out_pipe.read);
    out.exited_ = false;
    out.exit_code_ = -1;
    LogDebug("spawned %s (pid %d)", command.c_str(), static_cast<int>(pid));
    return Result::Ok();
}

Subprocess::Subprocess(Subprocess&& other) noexcept { *this = std::move(other); }

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        Cleanup();
        pid_ = other.pid_;
        stdin_ = std::move(other.stdin_);
        stdout_ = std::move(other.stdout_);
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exited_ = false;
    }
    return *this;
}

Subprocess::~Subprocess() { Cleanup(); }

void Subprocess::Cleanup() {
    stdin_.Close();
    stdout_.Close();
    if (pid_ > 0 && !exited_) {
        ::kill(pid_, SIGKILL);
        (void)Reap(true);
    }
    pid_ = -1;
}

bool Subprocess::Reap(bool block) {
    if (pid_ <= 0 || exited_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;
    exited_ = true;
    if (r == pid_ && WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else {
        exit_code_ = -1;
    }
    return true;
}

bool Subprocess::Running() {
    if (pid_ <= 0) return false;
    return !Reap(false);
}

bool Subprocess::WaitFor(std::chrono::milliseconds timeout, int* exit_code) {
    const auto deadline = Clock::now() + timeout;
    while (!Reap(false)) {
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (exit_code) *exit_code = exit_code_;
    return true;
}

Result Subprocess::Terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || exited_) return Result::Ok();

    ::kill(pid_, SIGTERM);
    if (WaitFor(grace)) return Result::Ok();

    LogWarn("pid %d ignored SIGTERM, killing", static_cast<int>(pid_));
    ::kill(pid_, SIGKILL);
    if (!Reap(true)) {
        return Result::Fail(ErrorKind::Process, "cannot reap pid " + std::to_string(pid_));
    }
    return Result::Ok();
}

Result RunAndCapture(const std::string& command,
                     const std::vector<std::string>& args,
                     std::chrono::milliseconds timeout,
                     CapturedOutput& out) {
    out = CapturedOutput{};

    Subprocess proc;
    Subprocess::Options opt;
    opt.merge_stderr = true;
    auto sr = Subprocess::Spawn(command, args, opt, proc);
    if (!sr.is_ok()) return sr;
    proc.CloseStdin();

    const auto deadline = Clock::now() + timeout;
    char buf[4096];
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            (void)proc.Terminate(std::chrono::milliseconds(0));
            return Result::Fail(ErrorKind::Process, command + " timed out");
        }

        pollfd pfd{proc.StdoutFd(), POLLIN, 0};
        const int pr = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Process, std::string("poll failed: ") + std::strerror(errno));
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(proc.StdoutFd(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Process, std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        out.output.append(buf, static_cast<size_t>(n));
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (!proc.WaitFor(left.count() > 0 ? left : std::chrono::milliseconds(0), &out.exit_code)) {
        (void)proc.Terminate(std::chrono::milliseconds(0));
        return Result::Fail(ErrorKind::Process, command + " did not exit");
    }
    return Result::Ok();
}

} // namespace lsmux
