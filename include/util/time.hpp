#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mg::util {

inline int64_t nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t toEpochMs(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochMs(const int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// filesystem clock -> wall clock
std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type ft);
std::filesystem::file_time_type toFileTime(std::chrono::system_clock::time_point tp);

// Epoch ms from ISO-8601 UTC ("2024-05-01T10:00:00Z"), 0 when unparsable.
int64_t parseIso8601Ms(const std::string& s);

}
