#pragma once

#include "lsmux/language_client.hpp"
#include "util/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lsmux {

// Running clients keyed by canonical root URI. At most one client per key.
class ClientRegistry {
public:
    ClientRegistry() = default;
    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    bool Contains(const std::string& root_key) const { return clients_.count(root_key) != 0; }
    ILanguageClient* Find(const std::string& root_key) const;

    // Fails with ErrorKind::Process for a key that is already registered.
    Result Insert(const std::string& root_key, std::unique_ptr<ILanguageClient> client);
    // Unregisters without stopping; the caller owns the client afterwards.
    std::unique_ptr<ILanguageClient> Take(const std::string& root_key);

    std::vector<std::string> Keys() const;
    std::size_t Size() const { return clients_.size(); }

    // Stops every client concurrently and waits for all of them. The registry
    // is emptied afterwards even when some stops failed.
    Result StopAll();

private:
    std::map<std::string, std::unique_ptr<ILanguageClient>> clients_;
};

} // namespace lsmux
