#pragma once

#include "protocol/Client.hpp"
#include "credentials/Resolver.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mg::protocol {

// FTP and SFTP over libcurl. Listings are parsed from the server's long (ls -l) format;
// mutations go through CURLOPT_QUOTE.
class CurlClient final : public Client {
public:
    static constexpr auto kPartialSuffix = ".mgpart";

    CurlClient(types::Protocol protocol, std::shared_ptr<const credentials::Resolver> resolver,
               size_t bufferSize = config::DEFAULT_BUFFER_SIZE,
               std::chrono::seconds lowSpeedTimeout = std::chrono::seconds(60));

    [[nodiscard]] types::Protocol protocol() const override { return protocol_; }
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
    types::VoidResult move(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::VoidResult copy(const types::ResourcePath& from, const types::ResourcePath& to, bool overwrite) override;
    types::Result<bool> exists(const types::ResourcePath& path) override;

    // One line of `ls -l` style output. Exposed for tests.
    static std::optional<types::FileInfo> parseListLine(const std::string& line, const types::ResourcePath& dir,
                                                        int64_t nowMs);

private:
    types::Protocol protocol_;
    std::shared_ptr<const credentials::Resolver> resolver_;
    size_t bufferSize_;
    std::chrono::seconds lowSpeedTimeout_;

    [[nodiscard]] std::string urlFor(const types::ResourcePath& path, bool asDirectory = false) const;
    [[nodiscard]] std::string removeCommand(const std::string& path, bool directory) const;
    [[nodiscard]] std::vector<std::string> renameCommands(const std::string& from, const std::string& to) const;
    [[nodiscard]] std::string mkdirCommand(const std::string& path) const;

    types::VoidResult runQuote(const types::ResourcePath& at, const std::vector<std::string>& commands);
    types::VoidResult removeTree(const types::ResourcePath& path, bool isDirectory);
};

}
