#include "lsmux/language_client.hpp"

#include "lsmux/version.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <unistd.h>

namespace lsmux {

const char* ClientStateName(ClientState s) {
    switch (s) {
    case ClientState::NoClient: return "no-client";
    case ClientState::Starting: return "starting";
    case ClientState::Running:  return "running";
    case ClientState::Stopped:  return "stopped";
    }
    return "unknown";
}

nlohmann::json BuildInitializeParams(const ClientLaunch& launch) {
    nlohmann::json folders = nlohmann::json::array();
    folders.push_back({{"uri", launch.root_uri}, {"name", launch.root_name}});

    return {
        {"processId", static_cast<int>(::getpid())},
        {"clientInfo", {{"name", "lsmux"}, {"version", kLsmuxVersion}}},
        {"rootUri", launch.root_uri},
        {"rootPath", FileUriToPath(launch.root_uri)},
        {"capabilities", nlohmann::json::object()},
        {"workspaceFolders", folders},
        {"initializationOptions", {{"rootModulePaths", launch.root_modules}}},
    };
}

ProcessLanguageClient::~ProcessLanguageClient() {
    Teardown();
}

Result ProcessLanguageClient::Start() {
    if (state_ == ClientState::Starting || state_ == ClientState::Running) {
        return Result::Fail(ErrorKind::Process, "client for " + launch_.root_uri + " is already " +
                                                    ClientStateName(state_));
    }
    state_ = ClientState::Starting;

    Subprocess::Options sopt;
    sopt.working_dir = FileUriToPath(launch_.root_uri);
    if (auto r = Subprocess::Spawn(launch_.command, launch_.args, sopt, process_); !r.is_ok()) {
        state_ = ClientState::Stopped;
        return r;
    }

    rpc_ = std::make_unique<JsonRpcConnection>(process_.StdoutFd(), process_.StdinFd());
    rpc_->Start();

    nlohmann::json init_result;
    auto r = rpc_->Request("initialize", BuildInitializeParams(launch_), timeouts_.initialize, init_result);
    if (!r.is_ok()) {
        LogError("initialize failed for %s: %s", launch_.root_uri.c_str(), r.msg.c_str());
        Teardown();
        state_ = ClientState::Stopped;
        return r;
    }
    if (auto n = rpc_->Notify("initialized", nlohmann::json::object()); !n.is_ok()) {
        Teardown();
        state_ = ClientState::Stopped;
        return n;
    }

    state_ = ClientState::Running;
    LogInfo("started %s for %s (pid %d)", launch_.command.c_str(), launch_.root_uri.c_str(),
            static_cast<int>(process_.Pid()));
    return Result::Ok();
}

Result ProcessLanguageClient::Stop() {
    if (state_ != ClientState::Running && state_ != ClientState::Starting) {
        state_ = ClientState::Stopped;
        return Result::Ok();
    }
    LogDebug("stopping %s client for %s", ClientStateName(state_), launch_.root_uri.c_str());

    if (rpc_ && rpc_->Alive()) {
        nlohmann::json ignored;
        auto r = rpc_->Request("shutdown", nullptr, timeouts_.shutdown, ignored);
        if (!r.is_ok()) {
            LogWarn("shutdown request for %s: %s", launch_.root_uri.c_str(), r.msg.c_str());
        } else if (auto n = rpc_->Notify("exit", nullptr); !n.is_ok()) {
            LogWarn("exit notification for %s: %s", launch_.root_uri.c_str(), n.msg.c_str());
        }
    }

    // Join the reader before stdin goes away so no reply is written to a closed fd.
    if (rpc_) {
        rpc_->Close();
        rpc_.reset();
    }
    process_.CloseStdin();
    int code = -1;
    Result result = Result::Ok();
    if (!process_.WaitFor(timeouts_.exit, &code)) {
        LogWarn("server for %s did not exit, terminating", launch_.root_uri.c_str());
        result = process_.Terminate(timeouts_.kill_grace);
    } else {
        LogDebug("server for %s exited with %d", launch_.root_uri.c_str(), code);
    }

    state_ = ClientState::Stopped;
    return result;
}

void ProcessLanguageClient::Teardown() {
    if (rpc_) {
        rpc_->Close();
        rpc_.reset();
        process_.CloseStdin();
        if (!process_.WaitFor(std::chrono::milliseconds(0))) {
            if (auto r = process_.Terminate(timeouts_.kill_grace); !r.is_ok()) {
                LogWarn("terminate %s: %s", launch_.root_uri.c_str(), r.msg.c_str());
            }
        }
    }
}

} // namespace lsmux
