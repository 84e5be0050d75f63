#include "lsmux/console_ui.hpp"
#include "lsmux/events.hpp"
#include "lsmux/install_orchestrator.hpp"
#include "lsmux/language_client.hpp"
#include "lsmux/lifecycle_manager.hpp"
#include "lsmux/progress_sinks.hpp"
#include "lsmux/version.hpp"
#include "lsmux/version_probe.hpp"
#include "lsmux/version_resolver.hpp"
#include "net/binary_fetcher.hpp"
#include "net/curl_http_client.hpp"
#include "system/signals.hpp"
#include "util/cancel_token.hpp"
#include "util/logger.hpp"
#include "util/settings.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace {

constexpr int kStdinPollMs = 200;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c settings.json] [-y] [-v] run\n"
        "   %s [-c settings.json] [-y] [-v] install [--dir <directory>]\n"
        "   %s [-c settings.json] [-v] resolve\n"
        "\n"
        "Options:\n"
        "  -c, --config    Settings file (default $XDG_CONFIG_HOME/lsmux/settings.json)\n"
        "  -y, --yes       Accept every prompt with its first action\n"
        "  -d, --dir       Install directory for 'install' (default lsmux.installDir)\n"
        "  -v, --verbose   Debug logging\n"
        "  -V, --version   Print version and exit\n"
        "  -h, --help      Show this help\n"
        "\n"
        "'run' reads one JSON event per line on stdin.\n",
        argv0, argv0, argv0);
}

std::string UserAgent(const lsmux::Platform& p) {
    return std::string("lsmux/") + lsmux::kLsmuxVersion + " (" + p.os + "; " + p.arch + ")";
}

// Reads stdin line by line and feeds the manager until EOF, a shutdown event,
// a reload request or a signal.
int RunEventLoop(lsmux::LifecycleManager& manager,
                 lsmux::ConsoleUserInterface& ui,
                 const lsmux::CancelToken& cancel) {
    std::string pending;
    char buf[4096];
    bool eof = false;

    while (!eof && !cancel.IsCancelled() && !ui.ReloadRequested()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, kStdinPollMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            LogError("poll stdin: %s", std::strerror(errno));
            break;
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            LogError("read stdin: %s", std::strerror(errno));
            break;
        }
        if (n == 0) {
            eof = true;
            if (!pending.empty()) pending.push_back('\n');
        } else {
            pending.append(buf, static_cast<size_t>(n));
        }

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

            auto ev = lsmux::ParseEventLine(line);
            if (!ev) {
                LogWarn("ignoring event line: %s", ev.error().c_str());
                continue;
            }
            manager.Post(std::move(*ev));
        }

        if (!manager.RunPending()) return 0;
    }

    if (auto r = manager.Deactivate(); !r.is_ok()) {
        LogError("shutdown: %s", r.msg.c_str());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    lsmux::CancelToken cancel;
    lsmux::InstallSignalHandlers(&cancel);

    std::string config_path = lsmux::DefaultSettingsPath();
    std::string dir_cli;
    bool assume_yes = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"yes", no_argument, nullptr, 'y'},
        {"dir", required_argument, nullptr, 'd'},
        {"verbose", no_argument, nullptr, 'v'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "c:yd:vVh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'c':
                config_path = optarg;
                break;
            case 'y':
                assume_yes = true;
                break;
            case 'd':
                dir_cli = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'V':
                std::printf("lsmux %s\n", lsmux::kLsmuxVersion);
                return 0;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];

    lsmux::SettingsFile store(config_path);
    lsmux::Settings settings;
    if (auto r = store.Load(settings); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: cannot load settings: %s\n", r.msg.c_str());
        return 1;
    }

    if (verbose) {
        lsmux::Logger::Instance().SetLevel(lsmux::LogLevel::Debug);
    } else if (auto lvl = lsmux::ParseLogLevel(settings.log_level)) {
        lsmux::Logger::Instance().SetLevel(*lvl);
    } else {
        LogWarn("unknown lsmux.logLevel '%s', using info", settings.log_level.c_str());
    }

    const lsmux::Platform platform = lsmux::HostPlatform();
    lsmux::CurlHttpClient http;

    if (command == "resolve") {
        lsmux::BinaryFetcher fetcher(http, &cancel);
        lsmux::VersionResolver resolver(fetcher, settings.releases_url);
        lsmux::Release latest;
        if (auto r = resolver.ResolveLatest(UserAgent(platform), latest); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        std::printf("%s\n", latest.version_text.c_str());
        return 0;
    }

    if (command != "run" && command != "install") {
        PrintUsage(argv[0]);
        return 2;
    }

    lsmux::ConsoleUserInterface ui(assume_yes);
    lsmux::ConsoleProgressSink progress;
    lsmux::ExecVersionProbe probe;

    lsmux::InstallOrchestrator::Options iopt;
    iopt.binary_name = settings.binary_name;
    iopt.releases_url = settings.releases_url;
    iopt.user_agent = UserAgent(platform);
    iopt.platform = platform;
    iopt.progress_sink = &progress;
    iopt.cancel = &cancel;
    lsmux::InstallOrchestrator installer(http, probe, ui, iopt);

    if (command == "install") {
        const std::string dir = dir_cli.empty() ? settings.install_dir : dir_cli;
        if (auto r = installer.Install(dir); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s [%s]\n", r.msg.c_str(), lsmux::ErrorKindName(r.kind));
            return 1;
        }
        return 0;
    }

    lsmux::ProcessClientFactory factory;
    int rc = 0;
    {
        lsmux::LifecycleManager manager(settings, installer, factory, ui, store);
        if (auto r = manager.Activate(); !r.is_ok()) {
            LogError("activation failed: %s", r.msg.c_str());
        }
        rc = RunEventLoop(manager, ui, cancel);
    }

    if (ui.ReloadRequested()) {
        LogInfo("reloading");
        ::execv("/proc/self/exe", argv);
        LogError("reload failed: %s", std::strerror(errno));
        return 1;
    }
    return rc;
}
