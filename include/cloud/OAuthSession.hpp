#pragma once

#include "cloud/TokenStore.hpp"
#include "config/Config.hpp"
#include "types/Result.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace mg::cloud {

// Token holder for one provider. refresh() runs the OAuth2 refresh_token grant against the
// provider's token endpoint and persists the new pair.
class OAuthSession {
public:
    struct TokenResponse {
        long status{};
        std::string body;
        std::string transportError;
    };

    // form-encoded POST; replaced in tests
    using TokenPoster = std::function<TokenResponse(const std::string& url, const std::string& form)>;

    OAuthSession(config::CloudProviderConfig cfg, std::shared_ptr<TokenStore> store, TokenPoster poster = {});

    [[nodiscard]] const std::string& provider() const { return cfg_.name; }

    [[nodiscard]] bool hasValidAccessToken() const;
    [[nodiscard]] bool canRefresh() const;
    [[nodiscard]] std::string accessToken() const;

    // Installs tokens obtained by the application's interactive sign-in.
    void setTokens(OAuthTokens tokens);

    bool restore();
    types::VoidResult refresh();
    void signOut();

private:
    config::CloudProviderConfig cfg_;
    std::shared_ptr<TokenStore> store_;
    TokenPoster poster_;

    mutable std::mutex mutex_;
    OAuthTokens tokens_;

    static TokenResponse postForm(const std::string& url, const std::string& form);
};

}
