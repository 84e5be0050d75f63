#include "lsmux/client_registry.hpp"

#include "util/logger.hpp"

#include <future>
#include <utility>

namespace lsmux {

ILanguageClient* ClientRegistry::Find(const std::string& root_key) const {
    auto it = clients_.find(root_key);
    return it == clients_.end() ? nullptr : it->second.get();
}

Result ClientRegistry::Insert(const std::string& root_key, std::unique_ptr<ILanguageClient> client) {
    if (!client) return Result::Fail(ErrorKind::Process, "null client for " + root_key);
    auto [it, inserted] = clients_.emplace(root_key, std::move(client));
    if (!inserted) {
        return Result::Fail(ErrorKind::Process, "client for " + root_key + " already registered");
    }
    return Result::Ok();
}

std::unique_ptr<ILanguageClient> ClientRegistry::Take(const std::string& root_key) {
    auto it = clients_.find(root_key);
    if (it == clients_.end()) return nullptr;
    auto client = std::move(it->second);
    clients_.erase(it);
    return client;
}

std::vector<std::string> ClientRegistry::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(clients_.size());
    for (const auto& [key, client] : clients_) keys.push_back(key);
    return keys;
}

Result ClientRegistry::StopAll() {
    if (clients_.empty()) return Result::Ok();

    std::vector<std::pair<std::string, std::future<Result>>> stops;
    stops.reserve(clients_.size());
    for (auto& [key, client] : clients_) {
        ILanguageClient* c = client.get();
        stops.emplace_back(key, std::async(std::launch::async, [c] { return c->Stop(); }));
    }

    Result first_failure = Result::Ok();
    for (auto& [key, fut] : stops) {
        Result r = Result::Ok();
        try {
            r = fut.get();
        } catch (const std::exception& e) {
            r = Result::Fail(ErrorKind::Process, std::string("stop threw: ") + e.what());
        }
        if (!r.is_ok()) {
            LogWarn("stopping client for %s: %s", key.c_str(), r.msg.c_str());
            if (first_failure.is_ok()) first_failure = r;
        }
    }

    LogDebug("stopped %zu client(s)", clients_.size());
    clients_.clear();
    return first_failure;
}

} // namespace lsmux
