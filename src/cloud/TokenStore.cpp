#include "cloud/TokenStore.hpp"
#include "crypto/encrypt.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace mg::cloud;

void mg::cloud::to_json(nlohmann::json& j, const OAuthTokens& t) {
    j = {
        {"access_token", t.accessToken},
        {"refresh_token", t.refreshToken},
        {"expires_at", t.expiresAt}
    };
}

void mg::cloud::from_json(const nlohmann::json& j, OAuthTokens& t) {
    t.accessToken = j.value("access_token", std::string{});
    t.refreshToken = j.value("refresh_token", std::string{});
    t.expiresAt = j.value("expires_at", int64_t{0});
}

TokenStore::TokenStore(std::filesystem::path path, std::vector<uint8_t> key)
    : path_(std::move(path)), key_(std::move(key)) {}

std::optional<OAuthTokens> TokenStore::load() const {
    std::scoped_lock lock(mutex_);
    if (path_.empty()) return memory_;
    if (!std::filesystem::exists(path_)) return std::nullopt;

    try {
        const auto plain = crypto::unseal(crypto::read_file(path_), key_);
        return nlohmann::json::parse(plain.begin(), plain.end()).get<OAuthTokens>();
    } catch (const std::exception& e) {
        // a corrupt or foreign-key file means the user signs in again
        log::Registry::cloud()->warn("[TokenStore] Unreadable token file {}: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

void TokenStore::save(const OAuthTokens& tokens) {
    std::scoped_lock lock(mutex_);
    if (path_.empty()) {
        memory_ = tokens;
        return;
    }

    const auto dumped = nlohmann::json(tokens).dump();
    crypto::write_file_atomic(path_, crypto::seal({dumped.begin(), dumped.end()}, key_));
}

void TokenStore::clear() {
    std::scoped_lock lock(mutex_);
    memory_.reset();
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}
