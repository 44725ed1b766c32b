#pragma once

#include "transfer/Strategy.hpp"

namespace mg::transfer {

// Any pair where the source can download and the destination can upload: the file is staged
// on local disk, then uploaded. Folders are recreated and walked.
class StreamingStrategy final : public Strategy {
public:
    [[nodiscard]] std::string name() const override { return "streaming"; }

    [[nodiscard]] bool canHandle(const types::ResourcePath& src, const protocol::Client& srcClient,
                                 const types::ResourcePath& dst, const protocol::Client& dstClient) const override;

    types::VoidResult copy(const TransferContext& ctx) override;

    static types::VoidResult copyEntry(const TransferContext& ctx);

private:
    static types::VoidResult copyFile(const TransferContext& ctx, const types::FileInfo& meta);
};

}
