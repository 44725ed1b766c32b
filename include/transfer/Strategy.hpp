#pragma once

#include "protocol/Client.hpp"
#include "transfer/ProgressChannel.hpp"

#include <filesystem>
#include <string>

namespace mg::transfer {

struct TransferContext {
    types::ResourcePath source;
    types::ResourcePath destination;
    protocol::Client& sourceClient;
    protocol::Client& destinationClient;
    bool overwrite;
    size_t bufferSize;
    std::filesystem::path stagingDir;
    const concurrency::CancelToken& cancel;
    ProgressChannel* progress = nullptr;
    size_t fileIndex = 0;
    size_t fileCount = 1;

    void report(uint64_t done, int64_t total, Stage stage) const;

    // Same settings, different endpoints (used when descending into folders).
    [[nodiscard]] TransferContext child(const std::string& name) const;
};

class Strategy {
public:
    virtual ~Strategy() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual bool canHandle(const types::ResourcePath& src, const protocol::Client& srcClient,
                                         const types::ResourcePath& dst, const protocol::Client& dstClient) const = 0;

    virtual types::VoidResult copy(const TransferContext& ctx) = 0;

    [[nodiscard]] virtual bool supportsNativeMove(const types::ResourcePath&, const protocol::Client&,
                                                  const types::ResourcePath&, const protocol::Client&) const {
        return false;
    }

    virtual types::VoidResult move(const TransferContext& ctx) {
        return types::Error(types::ErrorKind::UnsupportedCombination,
                            name() + " has no native move for " + ctx.source.scheme() + " -> " + ctx.destination.scheme());
    }
};

}
