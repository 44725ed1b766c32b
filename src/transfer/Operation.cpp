#include "transfer/Operation.hpp"

#include <fmt/format.h>

namespace mg::transfer {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
}

std::string describe(const Operation& op) {
    return std::visit(overloaded{
        [](const Copy& c) { return fmt::format("copy {} item(s) to {}", c.sources.size(), c.destinationFolder); },
        [](const Move& m) { return fmt::format("move {} item(s) to {}", m.sources.size(), m.destinationFolder); },
        [](const Delete& d) { return fmt::format("delete {} item(s){}", d.paths.size(), d.useTrash ? " to trash" : ""); },
        [](const Rename& r) { return fmt::format("rename {} to {}", r.path, r.newName); },
    }, op);
}

}
