#include "types/ResourcePath.hpp"

#include <charconv>
#include <vector>

namespace mg::types {

namespace {

constexpr std::string_view SCHEME_SEP = "://";

Result<uint16_t> parsePort(const std::string& s, const std::string& raw) {
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value == 0 || value > 65535)
        return Error(ErrorKind::InvalidArgument, "Invalid port in path: " + raw);
    return static_cast<uint16_t>(value);
}

}

std::string normalizeInnerPath(const std::string& p) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= p.size()) {
        const auto next = p.find('/', pos);
        const auto seg = p.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        if (next == std::string::npos) break;
        pos = next + 1;
    }

    std::string out;
    for (const auto& part : parts) out += "/" + part;
    return out.empty() ? "/" : out;
}

Result<ResourcePath> ResourcePath::parse(const std::string& input) {
    if (input.empty()) return Error(ErrorKind::InvalidArgument, "Empty resource path");

    std::string raw = input;
    // legacy single-slash cloud form
    if (raw.starts_with("cloud:/") && !raw.starts_with("cloud://")) raw = "cloud://" + raw.substr(7);

    ResourcePath rp;

    if (raw.front() == '/') {
        rp.protocol = Protocol::Local;
        rp.path = normalizeInnerPath(raw);
        return rp;
    }

    const auto sepPos = raw.find(SCHEME_SEP);
    if (sepPos == std::string::npos) return Error(ErrorKind::InvalidArgument, "Unrecognized path scheme: " + input);

    const auto proto = protocolFromScheme(raw.substr(0, sepPos));
    if (!proto) return Error(ErrorKind::InvalidArgument, "Unrecognized path scheme: " + input);
    rp.protocol = *proto;

    const auto rest = raw.substr(sepPos + SCHEME_SEP.size());

    if (rp.protocol == Protocol::Local) {
        if (rest.empty() || rest.front() != '/') return Error(ErrorKind::InvalidArgument, "Local path must be absolute: " + input);
        rp.path = normalizeInnerPath(rest);
        return rp;
    }

    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    const auto remainder = slash == std::string::npos ? std::string{} : rest.substr(slash);

    if (authority.empty()) return Error(ErrorKind::InvalidArgument, "Missing host in path: " + input);

    if (rp.protocol == Protocol::Cloud) {
        rp.provider = authority;
        rp.path = normalizeInnerPath(remainder);
        return rp;
    }

    if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        rp.host = authority.substr(0, colon);
        auto port = parsePort(authority.substr(colon + 1), input);
        if (!port) return port.propagate<ResourcePath>();
        rp.port = port.value();
    } else {
        rp.host = authority;
        rp.port = defaultPort(rp.protocol);
    }

    if (rp.host.empty()) return Error(ErrorKind::InvalidArgument, "Missing host in path: " + input);

    if (rp.protocol == Protocol::SMB) {
        const auto inner = normalizeInnerPath(remainder);
        if (inner == "/") return Error(ErrorKind::InvalidArgument, "SMB path without share name: " + input);
        const auto next = inner.find('/', 1);
        rp.share = inner.substr(1, next == std::string::npos ? std::string::npos : next - 1);
        rp.path = next == std::string::npos ? "/" : inner.substr(next);
        return rp;
    }

    rp.path = normalizeInnerPath(remainder);
    return rp;
}

std::string ResourcePath::resourceKey() const {
    switch (protocol) {
        case Protocol::Local: return "file://";
        case Protocol::Cloud: return "cloud://" + provider;
        case Protocol::SMB: return "smb://" + host + ":" + std::to_string(port) + "/" + share;
        default: return scheme() + "://" + host + ":" + std::to_string(port);
    }
}

std::string ResourcePath::filename() const {
    if (isRoot()) return {};
    return path.substr(path.rfind('/') + 1);
}

ResourcePath ResourcePath::parent() const {
    if (isRoot()) return *this;
    const auto pos = path.rfind('/');
    return withPath(pos == 0 ? "/" : path.substr(0, pos));
}

ResourcePath ResourcePath::join(const std::string& name) const {
    return withPath(isRoot() ? "/" + name : path + "/" + name);
}

ResourcePath ResourcePath::withPath(const std::string& innerPath) const {
    ResourcePath rp = *this;
    rp.path = normalizeInnerPath(innerPath);
    return rp;
}

ResourcePath ResourcePath::withFilename(const std::string& name) const {
    return parent().join(name);
}

std::string ResourcePath::toString() const {
    switch (protocol) {
        case Protocol::Local: return path;
        case Protocol::Cloud: return "cloud://" + provider + (isRoot() ? std::string{} : path);
        default: break;
    }

    std::string out = scheme() + "://" + host;
    if (port != defaultPort(protocol)) out += ":" + std::to_string(port);
    if (protocol == Protocol::SMB) out += "/" + share;
    if (!isRoot() || protocol != Protocol::SMB) out += path;
    return out;
}

}
