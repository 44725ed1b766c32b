#include "FakeCloudClient.hpp"

using namespace mg::test;
using namespace mg::types;

FakeCloudClient::FakeCloudClient(std::string provider, const bool signedIn)
    : provider_(std::move(provider)), signedIn_(signedIn) {}

VoidResult FakeCloudClient::authenticate() {
    ++authenticateCalls_;
    if (authenticateFails_) return Error(ErrorKind::AuthExpired, "Refresh token rejected");
    signedIn_ = true;
    expired_ = false;
    return success();
}

bool FakeCloudClient::tryRestoreSession() {
    ++restoreCalls_;
    if (restorable_) signedIn_ = true;
    return restorable_.load();
}

std::optional<Error> FakeCloudClient::gate() {
    ++requests_;
    if (!signedIn_) return Error(ErrorKind::NotAuthenticated, "Not authenticated");
    if (expired_ || rejectAlways_) {
        if (legacyErrors_) return Error(ErrorKind::Transport, "HTTP 401 Unauthorized");
        return Error(ErrorKind::AuthExpired, "Access token expired");
    }
    return std::nullopt;
}

Result<std::vector<FileInfo>> FakeCloudClient::listFiles(const ResourcePath& dir, const concurrency::CancelToken& cancel) {
    if (auto e = gate()) return *e;
    return storage_.listFiles(dir, cancel);
}

Result<FileInfo> FakeCloudClient::getMetadata(const ResourcePath& path) {
    if (auto e = gate()) return *e;
    return storage_.getMetadata(path);
}

Result<uint64_t> FakeCloudClient::download(const ResourcePath& path, std::ostream& out,
                                           const protocol::ProgressFn& progress,
                                           const concurrency::CancelToken& cancel) {
    if (auto e = gate()) return *e;
    return storage_.download(path, out, progress, cancel);
}

Result<uint64_t> FakeCloudClient::upload(std::istream& in, const int64_t size, const ResourcePath& path,
                                         const bool overwrite, const protocol::ProgressFn& progress,
                                         const concurrency::CancelToken& cancel) {
    if (auto e = gate()) return *e;
    return storage_.upload(in, size, path, overwrite, progress, cancel);
}

VoidResult FakeCloudClient::createFolder(const ResourcePath& path) {
    if (auto e = gate()) return *e;
    return storage_.createFolder(path);
}

VoidResult FakeCloudClient::remove(const ResourcePath& path) {
    if (auto e = gate()) return *e;
    return storage_.remove(path);
}

Result<ResourcePath> FakeCloudClient::rename(const ResourcePath& path, const std::string& newName) {
    if (auto e = gate()) return *e;
    return storage_.rename(path, newName);
}

VoidResult FakeCloudClient::move(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    if (auto e = gate()) return *e;
    return storage_.move(from, to, overwrite);
}

VoidResult FakeCloudClient::copy(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    if (auto e = gate()) return *e;
    return storage_.copy(from, to, overwrite);
}

Result<bool> FakeCloudClient::exists(const ResourcePath& path) {
    if (auto e = gate()) return *e;
    return storage_.exists(path);
}
