#pragma once

#include "protocol/Client.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace mg::protocol {

// scheme -> client, and for cloud paths provider -> client
class Registry {
public:
    void registerClient(std::shared_ptr<Client> client);
    void registerCloudClient(const std::string& provider, std::shared_ptr<Client> client);

    [[nodiscard]] types::Result<std::shared_ptr<Client>> find(const types::ResourcePath& path) const;
    [[nodiscard]] types::Result<std::shared_ptr<Client>> find(const std::string& path) const;

    [[nodiscard]] bool has(types::Protocol protocol) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<types::Protocol, std::shared_ptr<Client>> byProtocol_;
    std::map<std::string, std::shared_ptr<Client>> byProvider_;
};

}
