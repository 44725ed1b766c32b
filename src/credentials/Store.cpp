#include "credentials/Store.hpp"
#include "crypto/encrypt.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

using namespace mg::credentials;
using namespace mg::types;

Store::Store(std::filesystem::path storePath, std::vector<uint8_t> key)
    : storePath_(std::move(storePath)), key_(std::move(key)) {}

void Store::load() {
    if (storePath_.empty()) return;

    if (!std::filesystem::exists(storePath_)) {
        log::Registry::creds()->info("[CredentialStore] No store at {}, starting empty", storePath_.string());
        return;
    }

    const auto sealed = crypto::read_file(storePath_);
    const auto plain = crypto::unseal(sealed, key_);
    const auto j = nlohmann::json::parse(plain.begin(), plain.end());

    std::vector<NetworkCredentials> loaded;
    for (const auto& item : j) loaded.push_back(item.get<NetworkCredentials>());

    {
        std::unique_lock lock(mutex_);
        records_ = std::move(loaded);
    }
    ++generation_;
    log::Registry::creds()->debug("[CredentialStore] Loaded {} records", records_.size());
}

void Store::save() const {
    if (storePath_.empty()) return;

    nlohmann::json j = nlohmann::json::array();
    {
        std::shared_lock lock(mutex_);
        for (const auto& r : records_) j.push_back(r);
    }

    const auto dumped = j.dump();
    crypto::write_file_atomic(storePath_, crypto::seal({dumped.begin(), dumped.end()}, key_));
}

void Store::persistIfBacked() const {
    try {
        save();
    } catch (const std::exception& e) {
        log::Registry::creds()->error("[CredentialStore] Failed to persist {}: {}", storePath_.string(), e.what());
        throw;
    }
}

std::string Store::upsert(NetworkCredentials creds) {
    if (creds.port == 0) creds.port = defaultPort(creds.type);

    std::string id;
    {
        std::unique_lock lock(mutex_);
        const auto it = std::ranges::find_if(records_, [&](const auto& r) { return r.sameEndpoint(creds); });
        if (it != records_.end()) {
            if (creds.id.empty()) creds.id = it->id;
            *it = creds;
        } else {
            if (creds.id.empty()) {
                static thread_local boost::uuids::random_generator gen;
                creds.id = boost::uuids::to_string(gen());
            }
            records_.push_back(creds);
        }
        id = creds.id;
    }

    ++generation_;
    persistIfBacked();
    return id;
}

bool Store::remove(const Protocol type, const std::string& server, const uint16_t port) {
    bool removed = false;
    {
        std::unique_lock lock(mutex_);
        removed = std::erase_if(records_, [&](const auto& r) {
            return r.type == type && r.server == server && r.port == port;
        }) > 0;
    }

    if (removed) {
        ++generation_;
        persistIfBacked();
    }
    return removed;
}

std::optional<NetworkCredentials> Store::byServerAndShare(const std::string& server, const std::string& share) const {
    std::shared_lock lock(mutex_);
    for (const auto& r : records_)
        if (r.server == server && !r.share.empty() && r.share == share) return r;
    return std::nullopt;
}

std::optional<NetworkCredentials> Store::byHost(const std::string& server, const std::optional<Protocol> preferred) const {
    std::shared_lock lock(mutex_);
    std::optional<NetworkCredentials> fallback;
    for (const auto& r : records_) {
        if (r.server != server) continue;
        if (!preferred || r.type == *preferred) return r;
        if (!fallback) fallback = r;
    }
    return fallback;
}

std::optional<NetworkCredentials> Store::byTypeServerAndPort(const Protocol type, const std::string& server,
                                                              const uint16_t port) const {
    std::shared_lock lock(mutex_);
    for (const auto& r : records_)
        if (r.type == type && r.server == server && r.port == port) return r;
    return std::nullopt;
}

std::optional<NetworkCredentials> Store::byId(const std::string& id) const {
    std::shared_lock lock(mutex_);
    for (const auto& r : records_)
        if (r.id == id) return r;
    return std::nullopt;
}

std::vector<NetworkCredentials> Store::all() const {
    std::shared_lock lock(mutex_);
    return records_;
}
