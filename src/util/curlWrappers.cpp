#include "util/curlWrappers.hpp"

#include <cctype>
#include <fmt/format.h>

namespace mg::util {

std::string urlEncode(const std::string& s, const bool keepSlashes) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keepSlashes && c == '/'))
            out.push_back(static_cast<char>(c));
        else
            out += fmt::format("%{:02X}", c);
    }
    return out;
}

}
