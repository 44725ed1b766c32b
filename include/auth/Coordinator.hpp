#pragma once

#include "cloud/CloudClient.hpp"
#include "log/Registry.hpp"
#include "types/Result.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace mg::auth {

struct AuthRequired {
    std::string provider;
};

using ClientOrAuth = std::variant<std::shared_ptr<cloud::CloudClient>, AuthRequired, types::Error>;

class Coordinator {
public:
    void registerClient(std::shared_ptr<cloud::CloudClient> client);

    [[nodiscard]] std::shared_ptr<cloud::CloudClient> client(const std::string& provider) const;
    [[nodiscard]] std::vector<std::string> providers() const;

    // Never blocks on user interaction: an unrestorable session yields AuthRequired.
    [[nodiscard]] ClientOrAuth getClientOrRequireAuth(const std::string& provider) const;

    // Runs op(client). An auth-class failure triggers one silent authenticate() and, if that
    // succeeds, exactly one retry. Anything else, including the retry's result, is returned as is.
    // A failure the client marks reauthAttempted has had its one retry already and is returned.
    template <typename Fn>
    auto executeWithAutoReauth(const std::string& provider, Fn&& op)
        -> decltype(op(std::declval<cloud::CloudClient&>())) {
        using R = decltype(op(std::declval<cloud::CloudClient&>()));

        const auto c = client(provider);
        if (!c) return R(types::Error(types::ErrorKind::InvalidArgument, "Unknown cloud provider: " + provider));

        R first = op(*c);
        if (!isAuthFailure(first)) return first;
        if (first.error().reauthAttempted) {
            // the client already refreshed and retried this request itself
            log::Registry::auth()->debug("[AuthCoordinator] {} already re-authenticated for this call: {}",
                                         provider, first.describe());
            return first;
        }

        log::Registry::auth()->info("[AuthCoordinator] {} reported {}, attempting silent re-authentication",
                                    provider, first.describe());
        if (auto reauth = c->authenticate(); !reauth) {
            log::Registry::auth()->warn("[AuthCoordinator] Silent re-authentication for {} failed: {}",
                                        provider, reauth.describe());
            return first;
        }

        R second = op(*c);
        if (isAuthFailure(second))
            log::Registry::auth()->warn("[AuthCoordinator] {} still unauthorized after re-authentication", provider);
        return second;
    }

    bool signOut(const std::string& provider);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<cloud::CloudClient>> clients_;

    template <typename R>
    static bool isAuthFailure(const R& result) {
        return result.isError() && isAuthError(result.error());
    }

    static bool isAuthError(const types::Error& error);
};

}
