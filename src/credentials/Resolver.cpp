#include "credentials/Resolver.hpp"
#include "log/Registry.hpp"

using namespace mg::credentials;
using namespace mg::types;

Resolver::Resolver(std::shared_ptr<const Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Resolver requires a credential store");
}

Result<NetworkCredentials> Resolver::resolve(const std::string& path) const {
    if (!path.starts_with("smb://") && !path.starts_with("sftp://") && !path.starts_with("ftp://")) {
        log::Registry::creds()->warn("[Resolver] Unsupported path format: {}", path);
        return Error(ErrorKind::InvalidArgument, "Unsupported path format for credential lookup: " + path);
    }

    auto parsed = ResourcePath::parse(path);
    if (!parsed) return parsed.propagate<NetworkCredentials>();
    return resolve(parsed.value());
}

Result<NetworkCredentials> Resolver::resolve(const ResourcePath& path) const {
    if (path.protocol != Protocol::SMB && path.protocol != Protocol::SFTP && path.protocol != Protocol::FTP)
        return Error(ErrorKind::InvalidArgument, "No network credentials for protocol " + to_string(path.protocol));

    std::optional<NetworkCredentials> creds;
    if (!path.share.empty()) creds = store_->byServerAndShare(path.host, path.share);
    if (!creds) creds = store_->byHost(path.host, path.protocol);
    if (!creds) creds = store_->byTypeServerAndPort(path.protocol, path.host, path.port);

    if (!creds) {
        log::Registry::creds()->error("[Resolver] No credentials found for {}", path.resourceKey());
        return Error(ErrorKind::Configuration, "No credentials configured for " + path.resourceKey());
    }

    return *creds;
}
