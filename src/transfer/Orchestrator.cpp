#include "transfer/Orchestrator.hpp"
#include "transfer/SameProtocolStrategy.hpp"
#include "transfer/StreamingStrategy.hpp"
#include "log/Registry.hpp"

#include <set>

using namespace mg::transfer;
using namespace mg::types;
using namespace mg::concurrency;
using mg::throttle::SlotRequest;

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
}

Orchestrator::Orchestrator(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<throttle::Throttle> throttle,
                           std::shared_ptr<undo::TrashManager> trash, OrchestratorOptions options)
    : registry_(std::move(registry)), throttle_(std::move(throttle)), trash_(std::move(trash)),
      options_(std::move(options)) {
    if (!registry_ || !throttle_ || !trash_)
        throw std::invalid_argument("Orchestrator requires a registry, a throttle and a trash manager");
    strategies_.push_back(std::make_unique<SameProtocolStrategy>());
    strategies_.push_back(std::make_unique<StreamingStrategy>());
}

void Orchestrator::addStrategy(std::unique_ptr<Strategy> strategy) {
    if (!strategy) throw std::invalid_argument("Cannot register a null transfer strategy");
    strategies_.push_back(std::move(strategy));
}

Strategy* Orchestrator::strategyFor(const ResourcePath& src, const protocol::Client& srcClient,
                                          const ResourcePath& dst, const protocol::Client& dstClient) const {
    for (const auto& s : strategies_)
        if (s->canHandle(src, srcClient, dst, dstClient)) return s.get();
    return nullptr;
}

Result<std::vector<ResourcePath>> Orchestrator::parseAll(const std::vector<std::string>& paths) {
    std::vector<ResourcePath> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        auto parsed = ResourcePath::parse(p);
        if (!parsed) return parsed.propagate<std::vector<ResourcePath>>();
        out.push_back(std::move(parsed).value());
    }
    return out;
}

void Orchestrator::attachUndo(TransferReport& report, const undo::UndoKind kind) {
    if (report.succeeded == 0) return;
    undo::UndoRecord record;
    record.kind = kind;
    record.originalPaths = report.originalPaths;
    record.resultingPaths = report.resultingPaths;
    record.createdAt = std::chrono::system_clock::now();
    report.undoRecord = std::move(record);
}

Result<TransferReport> Orchestrator::finish(TransferReport report, const std::optional<undo::UndoKind> undoKind) {
    if (report.succeeded == 0 && report.failed > 0 && !report.errors.empty()) return report.errors.front();
    if (undoKind) attachUndo(report, *undoKind);
    return report;
}

Result<TransferReport> Orchestrator::execute(const Operation& op, ProgressChannel* progress, const CancelToken& cancel,
                                             TransferReport* partial) {
    log::Registry::transfer()->debug("[Orchestrator] {}", describe(op));
    return std::visit(overloaded{
        [&](const Copy& c) { return copy(c.sources, c.destinationFolder, c.overwrite, progress, cancel, partial); },
        [&](const Move& m) { return move(m.sources, m.destinationFolder, m.overwrite, progress, cancel, partial); },
        [&](const Delete& d) { return remove(d.paths, d.useTrash, cancel); },
        [&](const Rename& r) { return rename(r.path, r.newName, cancel); },
    }, op);
}

Result<TransferReport> Orchestrator::copy(const std::vector<std::string>& sources, const std::string& destinationFolder,
                                          const bool overwrite, ProgressChannel* progress, const CancelToken& cancel,
                                          TransferReport* partial) {
    return transfer(Mode::Copy, sources, destinationFolder, overwrite, progress, cancel, partial);
}

Result<TransferReport> Orchestrator::move(const std::vector<std::string>& sources, const std::string& destinationFolder,
                                          const bool overwrite, ProgressChannel* progress, const CancelToken& cancel,
                                          TransferReport* partial) {
    return transfer(Mode::Move, sources, destinationFolder, overwrite, progress, cancel, partial);
}

Result<TransferReport> Orchestrator::transfer(const Mode mode, const std::vector<std::string>& sources,
                                              const std::string& destinationFolder, const bool overwrite,
                                              ProgressChannel* progress, const CancelToken& cancel,
                                              TransferReport* partial) {
    const auto verb = mode == Mode::Copy ? "Copy" : "Move";
    const auto undoKind = mode == Mode::Copy ? undo::UndoKind::Copy : undo::UndoKind::Move;

    auto srcPaths = parseAll(sources);
    if (!srcPaths) return srcPaths.propagate<TransferReport>();
    auto dstDir = ResourcePath::parse(destinationFolder);
    if (!dstDir) return dstDir.propagate<TransferReport>();

    auto dstClientRes = registry_->find(dstDir.value());
    if (!dstClientRes) return dstClientRes.propagate<TransferReport>();
    auto& dstClient = *dstClientRes.value();

    // Resolve every pair before touching anything so an unsupported pair fails the whole request.
    std::vector<std::shared_ptr<protocol::Client>> srcClients;
    std::vector<Strategy*> chosen;
    for (const auto& src : srcPaths.value()) {
        auto c = registry_->find(src);
        if (!c) return c.propagate<TransferReport>();
        const auto dst = dstDir.value().join(src.filename());
        auto* s = strategyFor(src, *c.value(), dst, dstClient);
        if (!s) {
            log::Registry::transfer()->warn("[Orchestrator] No strategy for {} -> {}", src.scheme(), dst.scheme());
            return Error(ErrorKind::UnsupportedCombination,
                         "No transfer strategy for " + src.scheme() + " -> " + dst.scheme());
        }
        srcClients.push_back(c.value());
        chosen.push_back(s);
    }

    TransferReport report;
    const auto& srcs = srcPaths.value();
    const auto fail = [&](const ResourcePath& src, Error e) {
        log::Registry::transfer()->warn("[Orchestrator] {} {} failed: {}", verb, src.toString(), e.describe());
        ++report.failed;
        report.errors.push_back(std::move(e));
    };
    const auto cancelled = [&]() -> Result<TransferReport> {
        log::Registry::transfer()->info("[Orchestrator] {} to {} cancelled after {} item(s)", verb, destinationFolder,
                                        report.succeeded);
        if (partial) {
            *partial = report;
            attachUndo(*partial, undoKind);
        }
        return Cancelled{};
    };

    for (size_t i = 0; i < srcs.size(); ++i) {
        if (cancel.isCancelled()) return cancelled();

        const auto& src = srcs[i];
        auto& srcClient = *srcClients[i];
        auto* strategy = chosen[i];
        const auto dst = dstDir.value().join(src.filename());

        if (src.isRoot()) {
            fail(src, Error(ErrorKind::InvalidArgument, "Cannot transfer a root: " + src.toString()));
            continue;
        }
        if (src == dst) {
            fail(src, Error(ErrorKind::InvalidArgument, "Source and destination are the same: " + src.toString()));
            continue;
        }
        if (src.resourceKey() == dst.resourceKey() && dst.path.starts_with(src.path + "/")) {
            fail(src, Error(ErrorKind::InvalidArgument, "Cannot transfer a folder into itself: " + src.toString()));
            continue;
        }

        auto permits = throttle_->acquireAll({SlotRequest{src.protocol, src.resourceKey()},
                                              SlotRequest{dst.protocol, dst.resourceKey()}},
                                             options_.priority, cancel);
        if (permits.isCancelled()) return cancelled();
        if (!permits) {
            fail(src, permits.error());
            continue;
        }

        auto present = dstClient.exists(dst);
        if (!present) {
            if (present.isCancelled()) return cancelled();
            fail(src, present.error());
            continue;
        }
        if (present.value() && !overwrite) {
            fail(src, Error(ErrorKind::AlreadyExists, "Destination exists: " + dst.toString()));
            continue;
        }

        const TransferContext ctx{
            .source = src,
            .destination = dst,
            .sourceClient = srcClient,
            .destinationClient = dstClient,
            .overwrite = overwrite,
            .bufferSize = throttle_->recommendedBufferSize(src.resourceKey(), options_.bufferSize),
            .stagingDir = options_.stagingDir,
            .cancel = cancel,
            .progress = progress,
            .fileIndex = i,
            .fileCount = srcs.size()
        };

        VoidResult r = success();
        bool moved = false;
        if (mode == Mode::Move && strategy->supportsNativeMove(src, srcClient, dst, dstClient)) {
            r = strategy->move(ctx);
            moved = !r.is(ErrorKind::UnsupportedCombination);
            if (!moved)
                log::Registry::transfer()->debug("[Orchestrator] Native move of {} unavailable ({}), copying instead",
                                                 src.toString(), r.describe());
        }
        if (!moved) {
            r = strategy->copy(ctx);
            if (r && mode == Mode::Move) {
                // source goes only after its copy is complete
                if (auto removed = srcClient.remove(src); !removed) {
                    log::Registry::transfer()->warn("[Orchestrator] Copied {} but could not remove source: {}",
                                                    src.toString(), removed.describe());
                    if (removed.isError()) report.errors.push_back(removed.error());
                }
            }
        }

        if (r.isCancelled()) return cancelled();
        if (!r) {
            fail(src, r.error());
            continue;
        }

        ++report.succeeded;
        report.originalPaths.push_back(src.toString());
        report.resultingPaths.push_back(dst.toString());
    }

    log::Registry::transfer()->info("[Orchestrator] {} to {}: {} succeeded, {} failed", verb, destinationFolder,
                                    report.succeeded, report.failed);
    return finish(std::move(report), undoKind);
}

Result<TransferReport> Orchestrator::rename(const std::string& path, const std::string& newName,
                                            const CancelToken& cancel) {
    auto src = ResourcePath::parse(path);
    if (!src) return src.propagate<TransferReport>();
    auto client = registry_->find(src.value());
    if (!client) return client.propagate<TransferReport>();

    auto renamed = throttle_->withThrottle(src.value().protocol, src.value().resourceKey(), options_.priority,
        [&] { return client.value()->rename(src.value(), newName); }, cancel);
    if (!renamed) return renamed.propagate<TransferReport>();

    TransferReport report;
    report.succeeded = 1;
    report.originalPaths.push_back(src.value().toString());
    report.resultingPaths.push_back(renamed.value().toString());

    undo::UndoRecord record;
    record.kind = undo::UndoKind::Rename;
    record.originalPaths = report.originalPaths;
    record.resultingPaths = report.resultingPaths;
    record.renamePairs.emplace_back(report.originalPaths.front(), report.resultingPaths.front());
    record.createdAt = std::chrono::system_clock::now();
    report.undoRecord = std::move(record);

    log::Registry::transfer()->info("[Orchestrator] Renamed {} to {}", path, renamed.value().toString());
    return report;
}

Result<TransferReport> Orchestrator::remove(const std::vector<std::string>& paths, const bool useTrash,
                                            const CancelToken& cancel) {
    auto targets = parseAll(paths);
    if (!targets) return targets.propagate<TransferReport>();

    std::vector<SlotRequest> slots;
    for (const auto& t : targets.value()) slots.push_back({t.protocol, t.resourceKey()});
    auto permits = throttle_->acquireAll(std::move(slots), options_.priority, cancel);
    if (!permits) return permits.propagate<TransferReport>();

    TransferReport report;

    if (useTrash) {
        auto trashed = trash_->moveToTrash(targets.value(), cancel);
        if (!trashed) return trashed.propagate<TransferReport>();

        auto& t = trashed.value();
        report.succeeded = t.trashedOriginals.size();
        report.failed = t.errors.size();
        report.originalPaths = t.trashedOriginals;
        report.resultingPaths = t.trashFolders;
        report.errors = t.errors;

        log::Registry::transfer()->info("[Orchestrator] Trashed {} item(s) into {} folder(s), {} failed",
                                        report.succeeded, t.trashFolders.size(), report.failed);
        return finish(std::move(report), undo::UndoKind::Delete);
    }

    for (const auto& target : targets.value()) {
        if (cancel.isCancelled()) return Cancelled{};
        auto client = registry_->find(target);
        auto r = client ? client.value()->remove(target) : client.propagate<Unit>();
        if (!r) {
            ++report.failed;
            if (r.isError()) report.errors.push_back(r.error());
            continue;
        }
        ++report.succeeded;
        report.originalPaths.push_back(target.toString());
    }

    log::Registry::transfer()->info("[Orchestrator] Deleted {} item(s) permanently, {} failed",
                                    report.succeeded, report.failed);
    return finish(std::move(report), std::nullopt);
}
