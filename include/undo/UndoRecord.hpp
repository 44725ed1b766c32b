#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace mg::undo {

enum class UndoKind { Copy, Move, Delete, Rename };

std::string to_string(UndoKind kind);

struct UndoRecord {
    UndoKind kind{UndoKind::Copy};
    std::vector<std::string> originalPaths{};
    std::vector<std::string> resultingPaths{};     // Delete: the .trash_<ts> folders
    std::vector<std::pair<std::string, std::string>> renamePairs{};   // (oldPath, newPath)
    std::chrono::system_clock::time_point createdAt{};
};

}
