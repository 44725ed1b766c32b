#pragma once

#include "auth/Coordinator.hpp"
#include "cloud/CloudClient.hpp"

#include <memory>

namespace mg::auth {

// Cloud client seen by the transfer and undo layers: every call runs through the coordinator,
// so an expired session gets one silent re-authentication and one retry per call.
class ReauthClient final : public cloud::CloudClient {
public:
    ReauthClient(std::shared_ptr<cloud::CloudClient> inner, std::shared_ptr<Coordinator> coordinator);

    [[nodiscard]] const std::string& provider() const override { return inner_->provider(); }
    [[nodiscard]] protocol::Capabilities capabilities() const override { return inner_->capabilities(); }

    types::VoidResult authenticate() override { return inner_->authenticate(); }
    [[nodiscard]] bool isAuthenticated() const override { return inner_->isAuthenticated(); }
    void signOut() override { inner_->signOut(); }
    bool tryRestoreSession() override { return inner_->tryRestoreSession(); }

    types::Result<std::vector<types::FileInfo>> listFiles(const types::ResourcePath& dir,
                                                          const concurrency::CancelToken& cancel) override;
    types::Result<types::FileInfo> getMetadata(const types::ResourcePath& path) override;
    types::Result<uint64_t> download(const types::ResourcePath& path, std::ostream& out,
                                     const protocol::ProgressFn& progress,
                                     const concurrency::CancelToken& cancel) override;
    types::Result<uint64_t> upload(std::istream& in, int64_t size, const types::ResourcePath& path, bool overwrite,
                                   const protocol::ProgressFn& progress,
                                   const concurrency::CancelToken& cancel) override;
    types::VoidResult createFolder(const types::ResourcePath& path) override;
    types::VoidResult remove(const types::ResourcePath& path) override;
    types::Result<types::ResourcePath> rename(const types::ResourcePath& path, const std::string& newName) override;
    types::VoidResult move(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::VoidResult copy(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::Result<bool> exists(const types::ResourcePath& path) override;

    [[nodiscard]] const std::shared_ptr<cloud::CloudClient>& inner() const { return inner_; }

private:
    std::shared_ptr<cloud::CloudClient> inner_;
    std::shared_ptr<Coordinator> coordinator_;

    template <typename Fn>
    auto run(Fn&& op) -> decltype(op(std::declval<cloud::CloudClient&>())) {
        return coordinator_->executeWithAutoReauth(inner_->provider(), std::forward<Fn>(op));
    }
};

}
