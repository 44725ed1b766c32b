#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mg::util {

std::chrono::system_clock::time_point toSystemTime(const std::filesystem::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::filesystem::file_time_type::clock::to_sys(ft));
}

std::filesystem::file_time_type toFileTime(const std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::filesystem::file_time_type::clock::from_sys(tp));
}

int64_t parseIso8601Ms(const std::string& s) {
    std::tm tm{};
    std::istringstream in(s);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return 0;
    return static_cast<int64_t>(timegm(&tm)) * 1000;
}

}
