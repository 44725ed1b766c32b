#include "credentials/Credentials.hpp"

#include <nlohmann/json.hpp>

namespace mg::credentials {

void to_json(nlohmann::json& j, const NetworkCredentials& c) {
    j = {
        {"id", c.id},
        {"type", types::to_string(c.type)},
        {"server", c.server},
        {"port", c.port},
        {"username", c.username},
        {"password", c.password},
        {"domain", c.domain},
        {"share", c.share},
        {"private_key", c.privateKey}
    };
}

void from_json(const nlohmann::json& j, NetworkCredentials& c) {
    c.id = j.value("id", std::string{});
    const auto type = types::protocolFromString(j.at("type").get<std::string>());
    if (!type) throw std::invalid_argument("Unknown credential type: " + j.at("type").get<std::string>());
    c.type = *type;
    c.server = j.at("server").get<std::string>();
    c.port = j.value("port", types::defaultPort(c.type));
    c.username = j.value("username", std::string{});
    c.password = j.value("password", std::string{});
    c.domain = j.value("domain", std::string{});
    c.share = j.value("share", std::string{});
    c.privateKey = j.value("private_key", std::string{});
}

}
