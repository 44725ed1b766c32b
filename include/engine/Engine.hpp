#pragma once

#include "auth/Coordinator.hpp"
#include "cache/ContentCache.hpp"
#include "concurrency/CancelToken.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "credentials/Resolver.hpp"
#include "credentials/Store.hpp"
#include "engine/ResourceManager.hpp"
#include "protocol/Registry.hpp"
#include "throttle/Throttle.hpp"
#include "transfer/Orchestrator.hpp"
#include "undo/Manager.hpp"
#include "undo/TrashManager.hpp"
#include "undo/TrashSweeper.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace mg::engine {

struct EngineOptions {
    bool registerDefaultClients = true;   // local, SFTP, FTP and one REST client per cloud provider
    bool startSweeper = true;
    std::shared_ptr<credentials::Store> store{};   // loaded from config when empty
};

// Facade owning every component. All I/O runs on the worker pool and is reported through
// futures of Result; nothing thrown inside a worker escapes as an exception.
class Engine {
public:
    explicit Engine(config::Config cfg, EngineOptions options = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // SMB has no built-in client; the application supplies one.
    void registerClient(std::shared_ptr<protocol::Client> client);
    void registerCloudClient(std::shared_ptr<cloud::CloudClient> client);

    std::future<types::Result<std::vector<types::FileInfo>>> list(
        const std::string& path, const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<types::FileInfo>> metadata(const std::string& path);

    // Served from the content cache when the remote modified time still matches.
    std::future<types::Result<std::vector<uint8_t>>> read(
        const std::string& path, const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<uint64_t>> write(const std::string& path, std::vector<uint8_t> bytes, bool overwrite,
                                               const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<types::Unit>> createFolder(const std::string& path);

    std::future<types::Result<transfer::TransferReport>> copy(
        std::vector<std::string> sources, std::string destinationFolder, bool overwrite,
        transfer::ProgressChannel* progress = nullptr,
        const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<transfer::TransferReport>> move(
        std::vector<std::string> sources, std::string destinationFolder, bool overwrite,
        transfer::ProgressChannel* progress = nullptr,
        const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<transfer::TransferReport>> rename(std::string path, std::string newName);

    std::future<types::Result<transfer::TransferReport>> remove(
        std::vector<std::string> paths, bool useTrash = true,
        const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    std::future<types::Result<undo::UndoReport>> undo();

    [[nodiscard]] bool isUndoAvailable();
    [[nodiscard]] cache::CacheStatsSnapshot cacheStats() const;

    [[nodiscard]] const config::Config& config() const { return cfg_; }
    [[nodiscard]] ResourceManager& resources() { return *resources_; }
    [[nodiscard]] throttle::Throttle& throttle() { return *throttle_; }
    [[nodiscard]] auth::Coordinator& authCoordinator() { return *coordinator_; }
    [[nodiscard]] credentials::Store& credentialStore() { return *store_; }
    [[nodiscard]] cache::ContentCache& cache() { return *cache_; }
    [[nodiscard]] undo::TrashSweeper& trashSweeper() { return *sweeper_; }

    void shutdown();

private:
    config::Config cfg_;

    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<throttle::Throttle> throttle_;
    std::shared_ptr<credentials::Store> store_;
    std::shared_ptr<credentials::Resolver> resolver_;
    std::shared_ptr<protocol::Registry> registry_;
    std::shared_ptr<auth::Coordinator> coordinator_;
    std::shared_ptr<cache::ContentCache> cache_;
    std::shared_ptr<undo::TrashManager> trash_;
    std::shared_ptr<transfer::Orchestrator> orchestrator_;
    std::shared_ptr<undo::Manager> undo_;
    std::unique_ptr<undo::TrashSweeper> sweeper_;
    std::unique_ptr<ResourceManager> resources_;

    concurrency::CancelToken shutdown_;   // cancelled first by shutdown(), linked into every operation

    void registerDefaultClients();
    // A cancelled copy or move still records what it finished before the cancellation.
    void recordUndo(const types::Result<transfer::TransferReport>& result, const transfer::TransferReport& partial = {});

    // Cloud paths must belong to a signed-in (or silently restorable) provider.
    types::VoidResult ensureSignedIn(const std::vector<std::string>& paths) const;

    // Throttled client call; cloud calls additionally get one silent re-auth and retry.
    template <typename Fn>
    auto call(const types::ResourcePath& path, throttle::Priority priority, Fn&& op,
              const concurrency::CancelToken& cancel) -> decltype(op(std::declval<protocol::Client&>()));

    // Runs fn on the pool; an escaping exception becomes Error{Transport}.
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<decltype(fn())>;
};

}
