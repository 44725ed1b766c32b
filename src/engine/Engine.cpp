#include "engine/Engine.hpp"
#include "auth/ReauthClient.hpp"
#include "cloud/OAuthSession.hpp"
#include "cloud/RestCloudClient.hpp"
#include "cloud/TokenStore.hpp"
#include "crypto/encrypt.hpp"
#include "log/Registry.hpp"
#include "protocol/CurlClient.hpp"
#include "protocol/LocalClient.hpp"

#include <algorithm>
#include <set>
#include <sstream>

using namespace mg::engine;
using namespace mg::types;
using namespace mg::concurrency;
using namespace mg::log;
using mg::throttle::Priority;
using mg::transfer::TransferReport;

namespace {

std::shared_ptr<mg::credentials::Store> openStore(const mg::config::CredentialsConfig& cfg) {
    if (cfg.store_path.empty()) return std::make_shared<mg::credentials::Store>();
    auto store = std::make_shared<mg::credentials::Store>(cfg.store_path, mg::crypto::loadOrCreateKey(cfg.key_path));
    store->load();
    return store;
}

}

template <typename Fn>
auto Engine::submit(Fn&& fn) -> std::future<decltype(fn())> {
    using R = decltype(fn());
    return pool_->post([fn = std::forward<Fn>(fn)]() mutable -> R {
        try {
            return fn();
        } catch (const std::exception& e) {
            Registry::mediagate()->error("[Engine] Operation threw: {}", e.what());
            return R(Error(ErrorKind::Transport, "Unexpected failure", e.what()));
        }
    });
}

template <typename Fn>
auto Engine::call(const ResourcePath& path, const Priority priority, Fn&& op, const CancelToken& cancel)
    -> decltype(op(std::declval<protocol::Client&>())) {
    using R = decltype(op(std::declval<protocol::Client&>()));
    const auto key = path.resourceKey();

    if (path.protocol == Protocol::Cloud) {
        const auto state = coordinator_->getClientOrRequireAuth(path.provider);
        if (const auto* err = std::get_if<Error>(&state)) return R(*err);
        if (std::holds_alternative<auth::AuthRequired>(state))
            return R(Error(ErrorKind::NotAuthenticated, "Sign-in required for " + path.provider));

        return coordinator_->executeWithAutoReauth(path.provider, [&](cloud::CloudClient& c) {
            return throttle_->withThrottle(path.protocol, key, priority, [&] { return op(c); }, cancel);
        });
    }

    auto client = registry_->find(path);
    if (!client) return client.template propagate<typename R::value_type>();
    auto& c = *client.value();
    return throttle_->withThrottle(path.protocol, key, priority, [&] { return op(c); }, cancel);
}

Engine::Engine(config::Config cfg, EngineOptions options)
    : cfg_(std::move(cfg)) {
    pool_ = std::make_unique<ThreadPool>(std::max(1u, cfg_.workers.threads));
    throttle_ = std::make_shared<throttle::Throttle>(cfg_.throttle);
    store_ = options.store ? std::move(options.store) : openStore(cfg_.credentials);
    resolver_ = std::make_shared<credentials::Resolver>(store_);
    registry_ = std::make_shared<protocol::Registry>();
    coordinator_ = std::make_shared<auth::Coordinator>();
    cache_ = std::make_shared<cache::ContentCache>(cfg_.cache);
    trash_ = std::make_shared<undo::TrashManager>(registry_);

    transfer::OrchestratorOptions opts;
    opts.bufferSize = cfg_.transfer.buffer_size;
    opts.stagingDir = cfg_.transfer.staging_directory;
    orchestrator_ = std::make_shared<transfer::Orchestrator>(registry_, throttle_, trash_, opts);

    undo_ = std::make_shared<undo::Manager>(registry_, orchestrator_, throttle_, cfg_.undo.window);
    sweeper_ = std::make_unique<undo::TrashSweeper>(
        registry_, throttle_, std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.undo.trash_grace),
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.undo.sweep_interval), cfg_.undo.sweep_roots);
    trash_->setFolderObserver([sweeper = sweeper_.get()](const ResourcePath& parent) { sweeper->watch(parent); });

    resources_ = std::make_unique<ResourceManager>(throttle_, cache_, store_);

    if (options.registerDefaultClients) registerDefaultClients();
    if (options.startSweeper) sweeper_->start();

    Registry::mediagate()->info("[Engine] Started with {} worker(s), cache at {}", pool_->workerCount(),
                                cache_->directory().string());
}

Engine::~Engine() {
    shutdown();
}

void Engine::shutdown() {
    shutdown_.cancel();
    if (sweeper_) sweeper_->stop();
    if (pool_ && !pool_->isStopped()) {
        pool_->stop();
        Registry::mediagate()->info("[Engine] Shut down");
    }
}

void Engine::registerDefaultClients() {
    registry_->registerClient(std::make_shared<protocol::LocalClient>(cfg_.transfer.buffer_size));
    registry_->registerClient(std::make_shared<protocol::CurlClient>(Protocol::SFTP, resolver_, cfg_.transfer.buffer_size));
    registry_->registerClient(std::make_shared<protocol::CurlClient>(Protocol::FTP, resolver_, cfg_.transfer.buffer_size));

    for (const auto& p : cfg_.cloud.providers) {
        auto tokens = p.token_store.empty()
            ? std::make_shared<cloud::TokenStore>()
            : std::make_shared<cloud::TokenStore>(p.token_store, crypto::loadOrCreateKey(cfg_.credentials.key_path));
        auto session = std::make_shared<cloud::OAuthSession>(p, std::move(tokens));
        registerCloudClient(std::make_shared<cloud::RestCloudClient>(p, std::move(session)));
    }
}

void Engine::registerClient(std::shared_ptr<protocol::Client> client) {
    if (!client) throw std::invalid_argument("Cannot register a null client");
    Registry::mediagate()->debug("[Engine] Registered {} client", to_string(client->protocol()));
    registry_->registerClient(std::move(client));
}

void Engine::registerCloudClient(std::shared_ptr<cloud::CloudClient> client) {
    if (!client) throw std::invalid_argument("Cannot register a null cloud client");
    coordinator_->registerClient(client);
    registry_->registerCloudClient(client->provider(), std::make_shared<auth::ReauthClient>(client, coordinator_));
    Registry::mediagate()->debug("[Engine] Registered cloud provider {}", client->provider());
}

VoidResult Engine::ensureSignedIn(const std::vector<std::string>& paths) const {
    std::set<std::string> providers;
    for (const auto& p : paths) {
        auto parsed = ResourcePath::parse(p);
        if (parsed && parsed.value().protocol == Protocol::Cloud) providers.insert(parsed.value().provider);
    }

    for (const auto& provider : providers) {
        const auto state = coordinator_->getClientOrRequireAuth(provider);
        if (const auto* err = std::get_if<Error>(&state)) return *err;
        if (std::holds_alternative<auth::AuthRequired>(state))
            return Error(ErrorKind::NotAuthenticated, "Sign-in required for " + provider);
    }
    return success();
}

void Engine::recordUndo(const Result<TransferReport>& result, const TransferReport& partial) {
    if (result) {
        if (result.value().undoRecord) undo_->saveOperation(*result.value().undoRecord);
    } else if (result.isCancelled() && partial.undoRecord) {
        undo_->saveOperation(*partial.undoRecord);
    }
}

std::future<Result<std::vector<FileInfo>>> Engine::list(const std::string& path, const CancelToken& cancel) {
    return submit([this, path, cancel = cancel.linkedWith(shutdown_)]() -> Result<std::vector<FileInfo>> {
        auto parsed = ResourcePath::parse(path);
        if (!parsed) return parsed.propagate<std::vector<FileInfo>>();
        const auto& p = parsed.value();
        return call(p, Priority::High, [&](protocol::Client& c) { return c.listFiles(p, cancel); }, cancel);
    });
}

std::future<Result<FileInfo>> Engine::metadata(const std::string& path) {
    return submit([this, path]() -> Result<FileInfo> {
        auto parsed = ResourcePath::parse(path);
        if (!parsed) return parsed.propagate<FileInfo>();
        const auto& p = parsed.value();
        return call(p, Priority::High, [&](protocol::Client& c) { return c.getMetadata(p); }, shutdown_);
    });
}

std::future<Result<std::vector<uint8_t>>> Engine::read(const std::string& path, const CancelToken& cancel) {
    return submit([this, path, cancel = cancel.linkedWith(shutdown_)]() -> Result<std::vector<uint8_t>> {
        auto parsed = ResourcePath::parse(path);
        if (!parsed) return parsed.propagate<std::vector<uint8_t>>();
        const auto& p = parsed.value();
        const auto key = p.toString();

        auto info = call(p, Priority::Normal, [&](protocol::Client& c) { return c.getMetadata(p); }, cancel);
        if (!info) return info.propagate<std::vector<uint8_t>>();
        if (info.value().isDirectory)
            return Error(ErrorKind::InvalidArgument, "Cannot read a folder: " + key);

        const auto modified = info.value().modified;
        if (auto hit = cache_->get(key, modified)) return std::move(*hit);

        std::ostringstream buf(std::ios::binary);
        auto got = call(p, Priority::Normal, [&](protocol::Client& c) {
            buf.str({});
            return c.download(p, buf, {}, cancel);
        }, cancel);
        if (!got) return got.propagate<std::vector<uint8_t>>();

        const auto s = buf.str();
        std::vector<uint8_t> bytes(s.begin(), s.end());
        if (auto stored = cache_->put(key, modified, bytes); !stored)
            Registry::cache()->debug("[Engine] Not caching {}: {}", key, stored.describe());
        return bytes;
    });
}

std::future<Result<uint64_t>> Engine::write(const std::string& path, std::vector<uint8_t> bytes, const bool overwrite,
                                            const CancelToken& cancel) {
    return submit([this, path, bytes = std::move(bytes), overwrite,
                   cancel = cancel.linkedWith(shutdown_)]() -> Result<uint64_t> {
        auto parsed = ResourcePath::parse(path);
        if (!parsed) return parsed.propagate<uint64_t>();
        const auto& p = parsed.value();

        return call(p, Priority::Normal, [&](protocol::Client& c) {
            std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
            return c.upload(in, static_cast<int64_t>(bytes.size()), p, overwrite, {}, cancel);
        }, cancel);
    });
}

std::future<Result<Unit>> Engine::createFolder(const std::string& path) {
    return submit([this, path]() -> VoidResult {
        auto parsed = ResourcePath::parse(path);
        if (!parsed) return parsed.propagate<Unit>();
        const auto& p = parsed.value();
        return call(p, Priority::Normal, [&](protocol::Client& c) { return c.createFolder(p); }, shutdown_);
    });
}

std::future<Result<TransferReport>> Engine::copy(std::vector<std::string> sources, std::string destinationFolder,
                                                 const bool overwrite, transfer::ProgressChannel* progress,
                                                 const CancelToken& cancel) {
    return submit([this, sources = std::move(sources), dst = std::move(destinationFolder), overwrite, progress,
                   cancel = cancel.linkedWith(shutdown_)]() -> Result<TransferReport> {
        auto all = sources;
        all.push_back(dst);
        if (auto signedIn = ensureSignedIn(all); !signedIn) return signedIn.propagate<TransferReport>();

        TransferReport partial;
        auto result = orchestrator_->copy(sources, dst, overwrite, progress, cancel, &partial);
        recordUndo(result, partial);
        return result;
    });
}

std::future<Result<TransferReport>> Engine::move(std::vector<std::string> sources, std::string destinationFolder,
                                                 const bool overwrite, transfer::ProgressChannel* progress,
                                                 const CancelToken& cancel) {
    return submit([this, sources = std::move(sources), dst = std::move(destinationFolder), overwrite, progress,
                   cancel = cancel.linkedWith(shutdown_)]() -> Result<TransferReport> {
        auto all = sources;
        all.push_back(dst);
        if (auto signedIn = ensureSignedIn(all); !signedIn) return signedIn.propagate<TransferReport>();

        TransferReport partial;
        auto result = orchestrator_->move(sources, dst, overwrite, progress, cancel, &partial);
        recordUndo(result, partial);
        return result;
    });
}

std::future<Result<TransferReport>> Engine::rename(std::string path, std::string newName) {
    return submit([this, path = std::move(path), newName = std::move(newName)]() -> Result<TransferReport> {
        if (auto signedIn = ensureSignedIn({path}); !signedIn) return signedIn.propagate<TransferReport>();

        auto result = orchestrator_->rename(path, newName, shutdown_);
        recordUndo(result);
        return result;
    });
}

std::future<Result<TransferReport>> Engine::remove(std::vector<std::string> paths, const bool useTrash,
                                                   const CancelToken& cancel) {
    return submit([this, paths = std::move(paths), useTrash,
                   cancel = cancel.linkedWith(shutdown_)]() -> Result<TransferReport> {
        if (auto signedIn = ensureSignedIn(paths); !signedIn) return signedIn.propagate<TransferReport>();

        auto result = orchestrator_->remove(paths, useTrash, cancel);
        recordUndo(result);
        if (result) {
            for (const auto& p : result.value().originalPaths) cache_->invalidatePrefix(p);
        }
        return result;
    });
}

std::future<Result<mg::undo::UndoReport>> Engine::undo() {
    return submit([this]() -> Result<mg::undo::UndoReport> { return undo_->undo(); });
}

bool Engine::isUndoAvailable() {
    return undo_->isUndoAvailable();
}

mg::cache::CacheStatsSnapshot Engine::cacheStats() const {
    return cache_->stats();
}
