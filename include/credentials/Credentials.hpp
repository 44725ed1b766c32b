#pragma once

#include "types/Protocol.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mg::credentials {

struct NetworkCredentials {
    std::string id{};
    types::Protocol type{types::Protocol::SMB};
    std::string server{};
    uint16_t port{};
    std::string username{};
    std::string password{};
    std::string domain{};       // SMB
    std::string share{};        // SMB
    std::string privateKey{};   // SFTP, path to the private key file

    [[nodiscard]] bool sameEndpoint(const NetworkCredentials& other) const {
        return type == other.type && server == other.server && port == other.port;
    }
};

void to_json(nlohmann::json& j, const NetworkCredentials& c);
void from_json(const nlohmann::json& j, NetworkCredentials& c);

}
