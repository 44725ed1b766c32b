#pragma once

#include <string>
#include <variant>
#include <vector>

namespace mg::transfer {

struct Copy {
    std::vector<std::string> sources;
    std::string destinationFolder;
    bool overwrite = false;
};

// Across protocols: copy, then delete each source once its copy succeeded.
struct Move {
    std::vector<std::string> sources;
    std::string destinationFolder;
    bool overwrite = false;
};

struct Delete {
    std::vector<std::string> paths;
    bool useTrash = true;
};

struct Rename {
    std::string path;
    std::string newName;
};

using Operation = std::variant<Copy, Move, Delete, Rename>;

std::string describe(const Operation& op);

}
