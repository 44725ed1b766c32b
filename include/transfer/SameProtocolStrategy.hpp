#pragma once

#include "transfer/Strategy.hpp"

namespace mg::transfer {

// Both endpoints on one client and one resourceKey: server-side copy/move where the client
// offers it, otherwise streamed through the same client.
class SameProtocolStrategy final : public Strategy {
public:
    [[nodiscard]] std::string name() const override { return "same-protocol"; }

    [[nodiscard]] bool canHandle(const types::ResourcePath& src, const protocol::Client& srcClient,
                                 const types::ResourcePath& dst, const protocol::Client& dstClient) const override;

    types::VoidResult copy(const TransferContext& ctx) override;

    [[nodiscard]] bool supportsNativeMove(const types::ResourcePath& src, const protocol::Client& srcClient,
                                          const types::ResourcePath& dst,
                                          const protocol::Client& dstClient) const override;

    types::VoidResult move(const TransferContext& ctx) override;
};

}
