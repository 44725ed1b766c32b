#include "transfer/StreamingStrategy.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace mg::transfer;
using namespace mg::types;
namespace fs = std::filesystem;

bool StreamingStrategy::canHandle(const ResourcePath&, const protocol::Client& srcClient,
                                  const ResourcePath&, const protocol::Client& dstClient) const {
    return srcClient.capabilities().download && dstClient.capabilities().upload;
}

VoidResult StreamingStrategy::copy(const TransferContext& ctx) {
    return copyEntry(ctx);
}

VoidResult StreamingStrategy::copyEntry(const TransferContext& ctx) {
    if (ctx.cancel.isCancelled()) return Cancelled{};

    auto meta = ctx.sourceClient.getMetadata(ctx.source);
    if (!meta) return meta.propagate<Unit>();

    if (!meta.value().isDirectory) return copyFile(ctx, meta.value());

    if (auto r = ctx.destinationClient.createFolder(ctx.destination); !r) return r;

    auto children = ctx.sourceClient.listFiles(ctx.source, ctx.cancel);
    if (!children) return children.propagate<Unit>();

    for (const auto& child : children.value()) {
        if (ctx.cancel.isCancelled()) return Cancelled{};
        if (auto r = copyEntry(ctx.child(child.name)); !r) return r;
    }
    return success();
}

VoidResult StreamingStrategy::copyFile(const TransferContext& ctx, const FileInfo& meta) {
    static thread_local boost::uuids::random_generator gen;

    std::error_code ec;
    fs::create_directories(ctx.stagingDir, ec);
    const auto staging = ctx.stagingDir / ("mg-" + boost::uuids::to_string(gen()) + ".part");
    const auto dropStaging = [&] {
        std::error_code rmEc;
        fs::remove(staging, rmEc);
    };

    const auto total = meta.size > 0 ? static_cast<int64_t>(meta.size) : ProgressChannel::kUnknownTotal;

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) return Error(ErrorKind::Transport, "Cannot create staging file " + staging.string());

        auto fetched = ctx.sourceClient.download(ctx.source, out, [&](const uint64_t done, const int64_t t) {
            ctx.report(done, t >= 0 ? t : total, Stage::Reading);
        }, ctx.cancel);

        out.close();
        if (!fetched) {
            dropStaging();
            return fetched.propagate<Unit>();
        }
        if (!out) {
            dropStaging();
            return Error(ErrorKind::Transport, "Staging write failed for " + ctx.source.toString());
        }
    }

    const auto stagedSize = static_cast<int64_t>(fs::file_size(staging, ec));
    std::ifstream in(staging, std::ios::binary);
    if (!in) {
        dropStaging();
        return Error(ErrorKind::Transport, "Cannot reopen staging file " + staging.string());
    }

    // the destination client owns partial-file cleanup on failure or cancellation
    auto stored = ctx.destinationClient.upload(in, stagedSize, ctx.destination, ctx.overwrite,
        [&](const uint64_t done, const int64_t t) { ctx.report(done, t, Stage::Writing); }, ctx.cancel);

    in.close();
    dropStaging();

    if (!stored) {
        if (!stored.isCancelled())
            log::Registry::transfer()->warn("[StreamingStrategy] {} -> {}: {}", ctx.source.toString(),
                                            ctx.destination.toString(), stored.describe());
        return stored.propagate<Unit>();
    }

    ctx.report(stored.value(), stagedSize, Stage::Complete);
    return success();
}
