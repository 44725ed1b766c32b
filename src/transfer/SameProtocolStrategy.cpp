#include "transfer/SameProtocolStrategy.hpp"
#include "transfer/StreamingStrategy.hpp"

using namespace mg::transfer;
using namespace mg::types;

bool SameProtocolStrategy::canHandle(const ResourcePath& src, const protocol::Client& srcClient,
                                     const ResourcePath& dst, const protocol::Client& dstClient) const {
    return &srcClient == &dstClient && src.protocol == dst.protocol && src.resourceKey() == dst.resourceKey();
}

VoidResult SameProtocolStrategy::copy(const TransferContext& ctx) {
    if (ctx.cancel.isCancelled()) return Cancelled{};
    if (!ctx.sourceClient.capabilities().nativeCopy) return StreamingStrategy::copyEntry(ctx);

    ctx.report(0, ProgressChannel::kUnknownTotal, Stage::Writing);
    auto r = ctx.sourceClient.copy(ctx.source, ctx.destination, ctx.overwrite);
    if (r) ctx.report(0, ProgressChannel::kUnknownTotal, Stage::Complete);
    return r;
}

bool SameProtocolStrategy::supportsNativeMove(const ResourcePath& src, const protocol::Client& srcClient,
                                              const ResourcePath& dst, const protocol::Client& dstClient) const {
    return canHandle(src, srcClient, dst, dstClient) && srcClient.capabilities().nativeMove;
}

VoidResult SameProtocolStrategy::move(const TransferContext& ctx) {
    if (ctx.cancel.isCancelled()) return Cancelled{};
    auto r = ctx.sourceClient.move(ctx.source, ctx.destination, ctx.overwrite);
    if (r) ctx.report(0, ProgressChannel::kUnknownTotal, Stage::Complete);
    return r;
}
