#include "engine/Engine.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace mg;
using namespace mg::config;
using namespace mg::types;

namespace {

concurrency::CancelToken cancelToken;

void signalHandler(int) {
    cancelToken.cancel();
}

int usage() {
    std::cerr << "usage: mediagate <command> [args...]\n"
                 "  ls <path>                    list a folder\n"
                 "  stat <path>                  print metadata as JSON\n"
                 "  cat <path>                   write file contents to stdout\n"
                 "  cp [-f] <src>... <folder>    copy into folder (-f overwrites)\n"
                 "  mv [-f] <src>... <folder>    move into folder\n"
                 "  rm [--permanent] <path>...   move to trash, or delete permanently\n"
                 "  cache-stats                  print content cache statistics\n";
    return 2;
}

template <typename T>
int fail(const Result<T>& r) {
    std::cerr << "mediagate: " << r.describe() << "\n";
    return r.isCancelled() ? 130 : 1;
}

int printReport(const Result<transfer::TransferReport>& r) {
    if (!r) return fail(r);
    const auto& rep = r.value();
    for (size_t i = 0; i < rep.originalPaths.size(); ++i)
        fmt::print("{}{}\n", rep.originalPaths[i],
                   i < rep.resultingPaths.size() ? " -> " + rep.resultingPaths[i] : std::string{});
    for (const auto& e : rep.errors) std::cerr << "mediagate: " << e.describe() << "\n";
    return rep.failed == 0 ? 0 : 1;
}

int transferCommand(engine::Engine& engine, const std::string& cmd, std::vector<std::string> args) {
    bool overwrite = false;
    if (!args.empty() && args.front() == "-f") {
        overwrite = true;
        args.erase(args.begin());
    }
    if (args.size() < 2) return usage();

    const auto dst = args.back();
    args.pop_back();
    auto fut = cmd == "cp" ? engine.copy(args, dst, overwrite, nullptr, cancelToken)
                           : engine.move(args, dst, overwrite, nullptr, cancelToken);
    return printReport(fut.get());
}

int run(engine::Engine& engine, const std::string& cmd, std::vector<std::string> args) {
    if (cmd == "cache-stats") {
        fmt::print("{}\n", nlohmann::json(engine.cacheStats()).dump(2));
        return 0;
    }

    if (cmd == "ls") {
        if (args.size() != 1) return usage();
        const auto r = engine.list(args[0], cancelToken).get();
        if (!r) return fail(r);
        for (const auto& f : r.value())
            fmt::print("{:>12} {}{}\n", f.isDirectory ? std::string("-") : std::to_string(f.size), f.name,
                       f.isDirectory ? "/" : "");
        return 0;
    }

    if (cmd == "stat") {
        if (args.size() != 1) return usage();
        const auto r = engine.metadata(args[0]).get();
        if (!r) return fail(r);
        fmt::print("{}\n", nlohmann::json(r.value()).dump(2));
        return 0;
    }

    if (cmd == "cat") {
        if (args.size() != 1) return usage();
        const auto r = engine.read(args[0], cancelToken).get();
        if (!r) return fail(r);
        std::fwrite(r.value().data(), 1, r.value().size(), stdout);
        return 0;
    }

    if (cmd == "cp" || cmd == "mv") return transferCommand(engine, cmd, std::move(args));

    if (cmd == "rm") {
        bool permanent = false;
        if (!args.empty() && args.front() == "--permanent") {
            permanent = true;
            args.erase(args.begin());
        }
        if (args.empty()) return usage();
        return printReport(engine.remove(args, !permanent, cancelToken).get());
    }

    return usage();
}

}

int main(int argc, char** argv) {
    if (argc < 2) return usage();

    try {
        ConfigRegistry::init();
        log::Registry::init(ConfigRegistry::get().logging.log_dir);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // one-shot process: trash folders are swept by long-running hosts
        engine::Engine engine(ConfigRegistry::get(), {.registerDefaultClients = true, .startSweeper = false});

        const std::vector<std::string> args(argv + 2, argv + argc);
        const auto rc = run(engine, argv[1], args);
        engine.shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "mediagate: " << e.what() << "\n";
        if (log::Registry::isInitialized()) log::Registry::mediagate()->error("[main] {}", e.what());
        return EXIT_FAILURE;
    }
}
