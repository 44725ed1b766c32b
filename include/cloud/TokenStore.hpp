#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mg::cloud {

struct OAuthTokens {
    std::string accessToken{};
    std::string refreshToken{};
    int64_t expiresAt{};   // epoch ms, 0 = unknown

    [[nodiscard]] bool hasAccessToken() const { return !accessToken.empty(); }
    [[nodiscard]] bool isExpired(int64_t nowMs, int64_t skewMs = 60'000) const {
        return expiresAt != 0 && nowMs + skewMs >= expiresAt;
    }
};

void to_json(nlohmann::json& j, const OAuthTokens& t);
void from_json(const nlohmann::json& j, OAuthTokens& t);

// Encrypted-at-rest token file for one provider. An empty path keeps tokens in memory only.
class TokenStore {
public:
    TokenStore() = default;
    TokenStore(std::filesystem::path path, std::vector<uint8_t> key);

    [[nodiscard]] std::optional<OAuthTokens> load() const;
    void save(const OAuthTokens& tokens);
    void clear();

private:
    std::filesystem::path path_;
    std::vector<uint8_t> key_;
    mutable std::mutex mutex_;
    std::optional<OAuthTokens> memory_;
};

}
