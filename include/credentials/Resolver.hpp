#pragma once

#include "credentials/Store.hpp"
#include "types/ResourcePath.hpp"
#include "types/Result.hpp"

#include <memory>

namespace mg::credentials {

class Resolver {
public:
    explicit Resolver(std::shared_ptr<const Store> store);

    // smb://, sftp://, ftp:// only. NotFound is a Configuration error, never transient.
    [[nodiscard]] types::Result<NetworkCredentials> resolve(const std::string& path) const;
    [[nodiscard]] types::Result<NetworkCredentials> resolve(const types::ResourcePath& path) const;

private:
    std::shared_ptr<const Store> store_;
};

}
