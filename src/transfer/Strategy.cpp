#include "transfer/Strategy.hpp"

using namespace mg::transfer;

void TransferContext::report(const uint64_t done, const int64_t total, const Stage stage) const {
    if (!progress) return;
    progress->publish({
        .path = source.toString(),
        .bytesTransferred = done,
        .totalBytes = total,
        .fileIndex = fileIndex,
        .fileCount = fileCount,
        .stage = stage,
        .done = stage == Stage::Complete
    });
}

TransferContext TransferContext::child(const std::string& name) const {
    TransferContext c = *this;
    c.source = source.join(name);
    c.destination = destination.join(name);
    return c;
}
