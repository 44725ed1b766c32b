#include "cloud/OAuthSession.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/time.hpp"

#include <nlohmann/json.hpp>

using namespace mg::cloud;
using namespace mg::types;

OAuthSession::OAuthSession(config::CloudProviderConfig cfg, std::shared_ptr<TokenStore> store, TokenPoster poster)
    : cfg_(std::move(cfg)), store_(std::move(store)), poster_(std::move(poster)) {
    if (!store_) store_ = std::make_shared<TokenStore>();
    if (!poster_) poster_ = postForm;
}

OAuthSession::TokenResponse OAuthSession::postForm(const std::string& url, const std::string& form) {
    util::SList headers;
    headers.add("Content-Type: application/x-www-form-urlencoded");
    headers.add("Accept: application/json");

    const auto res = util::performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, form.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, 30L);
    });

    return {res.http, res.body, res.curl == CURLE_OK ? std::string{} : res.curlError()};
}

bool OAuthSession::hasValidAccessToken() const {
    std::scoped_lock lock(mutex_);
    return tokens_.hasAccessToken() && !tokens_.isExpired(util::nowMs());
}

bool OAuthSession::canRefresh() const {
    std::scoped_lock lock(mutex_);
    return !tokens_.refreshToken.empty();
}

std::string OAuthSession::accessToken() const {
    std::scoped_lock lock(mutex_);
    return tokens_.accessToken;
}

void OAuthSession::setTokens(OAuthTokens tokens) {
    {
        std::scoped_lock lock(mutex_);
        tokens_ = tokens;
    }
    store_->save(tokens);
}

bool OAuthSession::restore() {
    const auto stored = store_->load();
    if (!stored) return false;

    std::scoped_lock lock(mutex_);
    tokens_ = *stored;
    return tokens_.hasAccessToken() || !tokens_.refreshToken.empty();
}

VoidResult OAuthSession::refresh() {
    std::string refreshToken;
    {
        std::scoped_lock lock(mutex_);
        refreshToken = tokens_.refreshToken;
    }
    if (refreshToken.empty())
        return Error(ErrorKind::NotAuthenticated, "No refresh token for provider " + cfg_.name);
    if (cfg_.token_endpoint.empty())
        return Error(ErrorKind::Configuration, "No token endpoint configured for provider " + cfg_.name);

    const auto form = "grant_type=refresh_token&refresh_token=" + util::urlEncode(refreshToken) +
                      "&client_id=" + util::urlEncode(cfg_.client_id) +
                      (cfg_.client_secret.empty() ? std::string{} : "&client_secret=" + util::urlEncode(cfg_.client_secret));

    const auto res = poster_(cfg_.token_endpoint, form);
    if (!res.transportError.empty())
        return Error(ErrorKind::Transport, "Token refresh for " + cfg_.name + " failed", res.transportError);

    if (res.status == 400 || res.status == 401) {
        // invalid_grant: the refresh token was revoked
        log::Registry::cloud()->warn("[OAuthSession] Refresh rejected for {}: HTTP {}", cfg_.name, res.status);
        return Error(ErrorKind::AuthExpired, "Refresh token rejected by " + cfg_.name, res.body);
    }
    if (res.status / 100 != 2)
        return Error(ErrorKind::Transport, "Token endpoint for " + cfg_.name + " returned HTTP " + std::to_string(res.status), res.body);

    OAuthTokens updated;
    try {
        const auto j = nlohmann::json::parse(res.body);
        updated.accessToken = j.at("access_token").get<std::string>();
        updated.refreshToken = j.value("refresh_token", refreshToken);
        if (j.contains("expires_in")) updated.expiresAt = util::nowMs() + j.at("expires_in").get<int64_t>() * 1000;
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorKind::Transport, "Malformed token response from " + cfg_.name, e.what());
    }

    setTokens(updated);
    log::Registry::cloud()->debug("[OAuthSession] Refreshed access token for {}", cfg_.name);
    return success();
}

void OAuthSession::signOut() {
    {
        std::scoped_lock lock(mutex_);
        tokens_ = {};
    }
    store_->clear();
    log::Registry::cloud()->info("[OAuthSession] Signed out of {}", cfg_.name);
}
