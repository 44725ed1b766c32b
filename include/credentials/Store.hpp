#pragma once

#include "credentials/Credentials.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace mg::credentials {

// Authoritative credential records, at most one per (type, server, port).
// Persisted as a libsodium secretbox over a JSON array; a store without a path is memory-only.
class Store {
public:
    Store() = default;
    Store(std::filesystem::path storePath, std::vector<uint8_t> key);

    void load();
    void save() const;

    // Replaces any record with the same endpoint. Returns the stored id.
    std::string upsert(NetworkCredentials creds);
    bool remove(types::Protocol type, const std::string& server, uint16_t port);

    [[nodiscard]] std::optional<NetworkCredentials> byServerAndShare(const std::string& server, const std::string& share) const;
    [[nodiscard]] std::optional<NetworkCredentials> byHost(const std::string& server,
                                                           std::optional<types::Protocol> preferred = std::nullopt) const;
    [[nodiscard]] std::optional<NetworkCredentials> byTypeServerAndPort(types::Protocol type, const std::string& server,
                                                                        uint16_t port) const;
    [[nodiscard]] std::optional<NetworkCredentials> byId(const std::string& id) const;
    [[nodiscard]] std::vector<NetworkCredentials> all() const;

    // Bumped on every mutation; resources compare it to detect stale sessions.
    [[nodiscard]] uint64_t generation() const { return generation_.load(); }

private:
    std::filesystem::path storePath_;
    std::vector<uint8_t> key_;
    mutable std::shared_mutex mutex_;
    std::vector<NetworkCredentials> records_;
    std::atomic<uint64_t> generation_{0};

    void persistIfBacked() const;
};

}
