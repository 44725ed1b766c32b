#include "auth/Coordinator.hpp"

#include <mutex>
#include <ranges>

using namespace mg::auth;
using namespace mg::types;

void Coordinator::registerClient(std::shared_ptr<cloud::CloudClient> client) {
    if (!client) throw std::invalid_argument("Cannot register a null cloud client");
    const auto name = client->provider();
    std::unique_lock lock(mutex_);
    clients_[name] = std::move(client);
}

std::shared_ptr<mg::cloud::CloudClient> Coordinator::client(const std::string& provider) const {
    std::shared_lock lock(mutex_);
    const auto it = clients_.find(provider);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> Coordinator::providers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    for (const auto& name : clients_ | std::views::keys) out.push_back(name);
    return out;
}

ClientOrAuth Coordinator::getClientOrRequireAuth(const std::string& provider) const {
    const auto c = client(provider);
    if (!c) return Error(ErrorKind::InvalidArgument, "Unknown cloud provider: " + provider);

    if (c->isAuthenticated()) return c;

    if (c->tryRestoreSession()) {
        log::Registry::auth()->debug("[AuthCoordinator] Restored stored session for {}", provider);
        return c;
    }

    log::Registry::auth()->info("[AuthCoordinator] {} requires interactive sign-in", provider);
    return AuthRequired{provider};
}

bool Coordinator::signOut(const std::string& provider) {
    const auto c = client(provider);
    if (!c) return false;
    c->signOut();
    return true;
}

bool Coordinator::isAuthError(const Error& error) {
    if (error.isAuthError()) return true;
    // clients that only report text
    if (error.kind != ErrorKind::Transport) return false;
    const auto kind = classifyLegacyMessage(error.message + " " + error.cause);
    return kind == ErrorKind::AuthExpired || kind == ErrorKind::NotAuthenticated;
}
