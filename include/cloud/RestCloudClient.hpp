#pragma once

#include "cloud/CloudClient.hpp"
#include "cloud/OAuthSession.hpp"
#include "config/Config.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mg::cloud {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string body;                       // JSON RPC body when `upload` is null
    std::istream* upload = nullptr;
    int64_t uploadSize = protocol::kUnknownSize;
    std::ostream* download = nullptr;       // receives the body of 2xx responses only
    protocol::ProgressFn progress{};
    const concurrency::CancelToken* cancel = nullptr;
};

struct HttpResult {
    bool transportOk = true;
    std::string transportError;
    long status = 0;
    std::string body;                       // response body unless streamed into `download`
    uint64_t transferred = 0;
    bool cancelled = false;
    bool streamFailed = false;
};

// Path-addressed JSON REST storage API (Dropbox v2 style: RPC endpoints under api_base,
// content endpoints under content_base with the argument in a header).
class RestCloudClient final : public CloudClient {
public:
    using HttpTransport = std::function<HttpResult(const HttpRequest&)>;

    RestCloudClient(config::CloudProviderConfig cfg, std::shared_ptr<OAuthSession> session,
                    HttpTransport transport = {});

    [[nodiscard]] const std::string& provider() const override { return cfg_.name; }
    [[nodiscard]] protocol::Capabilities capabilities() const override {
        return {.download = true, .upload = true, .nativeMove = true, .nativeCopy = true};
    }

    types::VoidResult authenticate() override;
    [[nodiscard]] bool isAuthenticated() const override;
    void signOut() override;
    bool tryRestoreSession() override;

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

    // One request with the bearer token: 401 -> silent refresh -> exactly one retry.
    types::Result<HttpResult> authorizedRequest(HttpRequest req);

    [[nodiscard]] const std::shared_ptr<OAuthSession>& session() const { return session_; }

private:
    config::CloudProviderConfig cfg_;
    std::shared_ptr<OAuthSession> session_;
    HttpTransport transport_;

    static HttpResult performHttp(const HttpRequest& req);

    types::Result<nlohmann::json> rpc(const std::string& endpoint, const nlohmann::json& arg,
                                      const std::string& what);
    [[nodiscard]] types::FileInfo toFileInfo(const nlohmann::json& entry) const;
    [[nodiscard]] types::ResourcePath pathFor(const std::string& inner) const;
};

}
