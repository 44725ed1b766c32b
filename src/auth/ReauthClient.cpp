#include "auth/ReauthClient.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>

using namespace mg::auth;
using namespace mg::types;
using mg::concurrency::CancelToken;

ReauthClient::ReauthClient(std::shared_ptr<cloud::CloudClient> inner, std::shared_ptr<Coordinator> coordinator)
    : inner_(std::move(inner)), coordinator_(std::move(coordinator)) {
    if (!inner_ || !coordinator_) throw std::invalid_argument("ReauthClient requires a client and a coordinator");
}

Result<std::vector<FileInfo>> ReauthClient::listFiles(const ResourcePath& dir, const CancelToken& cancel) {
    return run([&](cloud::CloudClient& c) { return c.listFiles(dir, cancel); });
}

Result<FileInfo> ReauthClient::getMetadata(const ResourcePath& path) {
    return run([&](cloud::CloudClient& c) { return c.getMetadata(path); });
}

Result<uint64_t> ReauthClient::download(const ResourcePath& path, std::ostream& out,
                                        const protocol::ProgressFn& progress, const CancelToken& cancel) {
    const auto start = out.tellp();
    bool retry = false;
    return run([&](cloud::CloudClient& c) -> Result<uint64_t> {
        if (retry) {
            // bytes from the rejected attempt must not precede the real content
            if (out.tellp() != start) {
                if (start == std::ostream::pos_type(-1))
                    return Error(ErrorKind::AuthExpired, "Session for " + provider() + " expired mid-download")
                        .markReauthAttempted();
                out.clear();
                out.seekp(start);
            }
        }
        retry = true;
        return c.download(path, out, progress, cancel);
    });
}

Result<uint64_t> ReauthClient::upload(std::istream& in, const int64_t size, const ResourcePath& path,
                                      const bool overwrite, const protocol::ProgressFn& progress,
                                      const CancelToken& cancel) {
    const auto start = in.tellg();
    bool retry = false;
    return run([&](cloud::CloudClient& c) -> Result<uint64_t> {
        if (retry) {
            if (start == std::istream::pos_type(-1))
                return Error(ErrorKind::AuthExpired, "Session for " + provider() + " expired mid-upload on a non-seekable stream")
                    .markReauthAttempted();
            in.clear();
            in.seekg(start);
        }
        retry = true;
        return c.upload(in, size, path, overwrite, progress, cancel);
    });
}

VoidResult ReauthClient::createFolder(const ResourcePath& path) {
    return run([&](cloud::CloudClient& c) { return c.createFolder(path); });
}

VoidResult ReauthClient::remove(const ResourcePath& path) {
    return run([&](cloud::CloudClient& c) { return c.remove(path); });
}

Result<ResourcePath> ReauthClient::rename(const ResourcePath& path, const std::string& newName) {
    return run([&](cloud::CloudClient& c) { return c.rename(path, newName); });
}

VoidResult ReauthClient::move(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    return run([&](cloud::CloudClient& c) { return c.move(from, to, overwrite); });
}

VoidResult ReauthClient::copy(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    return run([&](cloud::CloudClient& c) { return c.copy(from, to, overwrite); });
}

Result<bool> ReauthClient::exists(const ResourcePath& path) {
    return run([&](cloud::CloudClient& c) { return c.exists(path); });
}
