#pragma once

#include "concurrency/CancelToken.hpp"
#include "types/FileInfo.hpp"
#include "types/Protocol.hpp"
#include "types/ResourcePath.hpp"
#include "types/Result.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <vector>

namespace mg::protocol {

constexpr int64_t kUnknownSize = -1;

// (bytesTransferred, totalBytes or kUnknownSize)
using ProgressFn = std::function<void(uint64_t, int64_t)>;

struct Capabilities {
    bool download = true;
    bool upload = true;
    bool nativeMove = false;
    bool nativeCopy = false;
};

// One implementation per scheme. Every call addresses a parsed path and reports through
// Result; nothing expected (missing file, auth expiry, cancellation) throws.
class Client {
public:
    virtual ~Client() = default;

    [[nodiscard]] virtual types::Protocol protocol() const = 0;
    [[nodiscard]] virtual Capabilities capabilities() const = 0;

    virtual types::Result<std::vector<types::FileInfo>> listFiles(const types::ResourcePath& dir,
                                                                  const concurrency::CancelToken& cancel) = 0;

    virtual types::Result<types::FileInfo> getMetadata(const types::ResourcePath& path) = 0;

    // Returns the number of bytes written to `out`.
    virtual types::Result<uint64_t> download(const types::ResourcePath& path, std::ostream& out,
                                             const ProgressFn& progress,
                                             const concurrency::CancelToken& cancel) = 0;

    // `size` may be kUnknownSize. The destination never appears complete unless the upload finished.
    virtual types::Result<uint64_t> upload(std::istream& in, int64_t size, const types::ResourcePath& path,
                                           bool overwrite, const ProgressFn& progress,
                                           const concurrency::CancelToken& cancel) = 0;

    virtual types::VoidResult createFolder(const types::ResourcePath& path) = 0;

    // Files and folders; folders recursively.
    virtual types::VoidResult remove(const types::ResourcePath& path) = 0;

    virtual types::Result<types::ResourcePath> rename(const types::ResourcePath& path, const std::string& newName) = 0;

    virtual types::VoidResult move(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) = 0;

    virtual types::VoidResult copy(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) = 0;

    virtual types::Result<bool> exists(const types::ResourcePath& path) = 0;
};

}
