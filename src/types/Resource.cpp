#include "types/Resource.hpp"
#include "types/ResourcePath.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

namespace mg::types {

Resource Resource::create(const std::string& name, const std::string& root, const bool writable) {
    auto parsed = ResourcePath::parse(root);
    if (!parsed) throw std::invalid_argument("Invalid resource root: " + parsed.describe());

    static thread_local boost::uuids::random_generator gen;

    Resource r;
    r.id = boost::uuids::to_string(gen());
    r.name = name;
    r.protocol = parsed.value().protocol;
    r.root = parsed.value().toString();
    r.writable = writable;
    return r;
}

void to_json(nlohmann::json& j, const Resource& r) {
    j = {
        {"id", r.id},
        {"name", r.name},
        {"protocol", to_string(r.protocol)},
        {"root", r.root},
        {"writable", r.writable},
        {"needs_reauth", r.needsReauth}
    };
    if (r.credentialRef) j["credential_ref"] = *r.credentialRef;
    if (r.recommendedConcurrency) j["recommended_concurrency"] = *r.recommendedConcurrency;
    if (r.recommendedBufferSize) j["recommended_buffer_size"] = *r.recommendedBufferSize;
}

void from_json(const nlohmann::json& j, Resource& r) {
    r.id = j.at("id").get<std::string>();
    r.name = j.value("name", std::string{});
    const auto proto = protocolFromString(j.at("protocol").get<std::string>());
    if (!proto) throw std::invalid_argument("Unknown protocol in resource: " + j.at("protocol").get<std::string>());
    r.protocol = *proto;
    r.root = j.at("root").get<std::string>();
    r.writable = j.value("writable", true);
    r.needsReauth = j.value("needs_reauth", false);
    if (j.contains("credential_ref")) r.credentialRef = j.at("credential_ref").get<std::string>();
    if (j.contains("recommended_concurrency")) r.recommendedConcurrency = j.at("recommended_concurrency").get<unsigned int>();
    if (j.contains("recommended_buffer_size")) r.recommendedBufferSize = j.at("recommended_buffer_size").get<size_t>();
}

}
