#pragma once

#include "protocol/Client.hpp"
#include "config/Config.hpp"

namespace mg::protocol {

class LocalClient final : public Client {
public:
    static constexpr auto kPartialSuffix = ".mgpart";

    explicit LocalClient(size_t bufferSize = config::DEFAULT_BUFFER_SIZE);

    [[nodiscard]] types::Protocol protocol() const override { return types::Protocol::Local; }
    // No native copy: copies stream in buffer-sized steps so they can be cancelled and report progress.
    [[nodiscard]] Capabilities capabilities() const override {
        return {.download = true, .upload = true, .nativeMove = true, .nativeCopy = false};
    }

    types::Result<std::vector<types::FileInfo>> listFiles(const types::ResourcePath& dir,
                                                          const concurrency::CancelToken& cancel) override;
    types::Result<types::FileInfo> getMetadata(const types::ResourcePath& path) override;
    types::Result<uint64_t> download(const types::ResourcePath& path, std::ostream& out,
                                     const ProgressFn& progress, const concurrency::CancelToken& cancel) override;
    types::Result<uint64_t> upload(std::istream& in, int64_t size, const types::ResourcePath& path, bool overwrite,
                                   const ProgressFn& progress, const concurrency::CancelToken& cancel) override;
    types::VoidResult createFolder(const types::ResourcePath& path) override;
    types::VoidResult remove(const types::ResourcePath& path) override;
    types::Result<types::ResourcePath> rename(const types::ResourcePath& path, const std::string& newName) override;
    // A move across filesystems yields UnsupportedCombination; callers copy and delete instead.
    types::VoidResult move(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::VoidResult copy(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::Result<bool> exists(const types::ResourcePath& path) override;

private:
    size_t bufferSize_;
};

}
