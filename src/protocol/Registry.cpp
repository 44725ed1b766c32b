#include "protocol/Registry.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <stdexcept>

using namespace mg::protocol;
using namespace mg::types;

void Registry::registerClient(std::shared_ptr<Client> client) {
    if (!client) throw std::invalid_argument("Cannot register a null protocol client");
    if (client->protocol() == Protocol::Cloud)
        throw std::invalid_argument("Cloud clients are registered per provider");

    const auto p = client->protocol();
    std::unique_lock lock(mutex_);
    byProtocol_[p] = std::move(client);
    log::Registry::protocol()->debug("[ProtocolRegistry] Registered {} client", to_string(p));
}

void Registry::registerCloudClient(const std::string& provider, std::shared_ptr<Client> client) {
    if (!client) throw std::invalid_argument("Cannot register a null cloud client");
    std::unique_lock lock(mutex_);
    byProvider_[provider] = std::move(client);
    log::Registry::protocol()->debug("[ProtocolRegistry] Registered cloud provider {}", provider);
}

Result<std::shared_ptr<Client>> Registry::find(const ResourcePath& path) const {
    std::shared_lock lock(mutex_);

    if (path.protocol == Protocol::Cloud) {
        const auto it = byProvider_.find(path.provider);
        if (it == byProvider_.end())
            return Error(ErrorKind::Configuration, "No cloud client registered for provider '" + path.provider + "'");
        return it->second;
    }

    const auto it = byProtocol_.find(path.protocol);
    if (it == byProtocol_.end())
        return Error(ErrorKind::Configuration, "No client registered for scheme " + path.scheme() + "://");
    return it->second;
}

Result<std::shared_ptr<Client>> Registry::find(const std::string& path) const {
    auto parsed = ResourcePath::parse(path);
    if (!parsed) return parsed.propagate<std::shared_ptr<Client>>();
    return find(parsed.value());
}

bool Registry::has(const Protocol protocol) const {
    std::shared_lock lock(mutex_);
    if (protocol == Protocol::Cloud) return !byProvider_.empty();
    return byProtocol_.contains(protocol);
}
