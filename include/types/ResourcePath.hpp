#pragma once

#include "types/Protocol.hpp"
#include "types/Result.hpp"

#include <cstdint>
#include <string>

namespace mg::types {

// Parsed resource address:
//   smb://host[:port]/share/inner     sftp://host[:port]/inner     ftp://host[:port]/inner
//   cloud://provider/inner            /absolute/local/path         file:///absolute/local/path
struct ResourcePath {
    Protocol protocol{Protocol::Local};
    std::string host{};
    uint16_t port{};
    std::string share{};
    std::string provider{};
    std::string path{"/"};

    [[nodiscard]] static Result<ResourcePath> parse(const std::string& raw);

    [[nodiscard]] std::string scheme() const { return schemeOf(protocol); }

    // Throttle scope: protocol + endpoint (+ share for SMB), never a single file.
    [[nodiscard]] std::string resourceKey() const;

    [[nodiscard]] std::string filename() const;
    [[nodiscard]] ResourcePath parent() const;
    [[nodiscard]] ResourcePath join(const std::string& name) const;
    [[nodiscard]] ResourcePath withPath(const std::string& innerPath) const;
    [[nodiscard]] ResourcePath withFilename(const std::string& name) const;
    [[nodiscard]] bool isRoot() const { return path == "/"; }

    [[nodiscard]] std::string toString() const;

    bool operator==(const ResourcePath& other) const = default;
};

std::string normalizeInnerPath(const std::string& p);

}
