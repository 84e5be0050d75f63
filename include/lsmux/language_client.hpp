#pragma once

#include "process/jsonrpc_connection.hpp"
#include "process/subprocess.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace lsmux {

enum class ClientState {
    NoClient,
    Starting,
    Running,
    Stopped,
};

const char* ClientStateName(ClientState s);

struct ClientLaunch {
    std::string command;
    std::vector<std::string> args;
    std::string root_uri;  // registry key, trailing '/'
    std::string root_name;
    std::vector<std::string> root_modules;
};

class ILanguageClient {
public:
    virtual ~ILanguageClient() = default;
    virtual Result Start() = 0;
    // Returns once the server has acknowledged or been killed.
    virtual Result Stop() = 0;
    virtual ClientState State() const = 0;
};

class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<ILanguageClient> Create(const ClientLaunch& launch) = 0;
};

// The "initialize" request sent for a root.
nlohmann::json BuildInitializeParams(const ClientLaunch& launch);

class ProcessLanguageClient final : public ILanguageClient {
public:
    struct Timeouts {
        std::chrono::milliseconds initialize = std::chrono::seconds(30);
        std::chrono::milliseconds shutdown = std::chrono::seconds(5);
        std::chrono::milliseconds exit = std::chrono::seconds(2);
        std::chrono::milliseconds kill_grace = std::chrono::seconds(2);
    };

    explicit ProcessLanguageClient(ClientLaunch launch) : launch_(std::move(launch)) {}
    ProcessLanguageClient(ClientLaunch launch, Timeouts t) : launch_(std::move(launch)), timeouts_(t) {}
    ~ProcessLanguageClient() override;

    Result Start() override;
    Result Stop() override;
    ClientState State() const override { return state_; }

    const ClientLaunch& Launch() const { return launch_; }

private:
    void Teardown();

    ClientLaunch launch_;
    Timeouts timeouts_{};
    ClientState state_ = ClientState::NoClient;
    Subprocess process_;
    std::unique_ptr<JsonRpcConnection> rpc_;
};

class ProcessClientFactory final : public IClientFactory {
public:
    std::unique_ptr<ILanguageClient> Create(const ClientLaunch& launch) override {
        return std::make_unique<ProcessLanguageClient>(launch);
    }
};

} // namespace lsmux
