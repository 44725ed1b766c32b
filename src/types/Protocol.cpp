#include "types/Protocol.hpp"

#include <algorithm>
#include <cctype>

namespace mg::types {

std::string to_string(const Protocol p) {
    switch (p) {
        case Protocol::Local: return "LOCAL";
        case Protocol::SMB: return "SMB";
        case Protocol::SFTP: return "SFTP";
        case Protocol::FTP: return "FTP";
        case Protocol::Cloud: return "CLOUD";
    }
    return "UNKNOWN";
}

std::string schemeOf(const Protocol p) {
    switch (p) {
        case Protocol::Local: return "file";
        case Protocol::SMB: return "smb";
        case Protocol::SFTP: return "sftp";
        case Protocol::FTP: return "ftp";
        case Protocol::Cloud: return "cloud";
    }
    return {};
}

std::optional<Protocol> protocolFromScheme(const std::string_view scheme) {
    if (scheme == "file") return Protocol::Local;
    if (scheme == "smb") return Protocol::SMB;
    if (scheme == "sftp") return Protocol::SFTP;
    if (scheme == "ftp") return Protocol::FTP;
    if (scheme == "cloud") return Protocol::Cloud;
    return std::nullopt;
}

std::optional<Protocol> protocolFromString(const std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(), [](const unsigned char c) { return std::toupper(c); });
    if (upper == "LOCAL") return Protocol::Local;
    if (upper == "SMB") return Protocol::SMB;
    if (upper == "SFTP") return Protocol::SFTP;
    if (upper == "FTP") return Protocol::FTP;
    if (upper == "CLOUD") return Protocol::Cloud;
    return std::nullopt;
}

uint16_t defaultPort(const Protocol p) {
    switch (p) {
        case Protocol::SMB: return 445;
        case Protocol::SFTP: return 22;
        case Protocol::FTP: return 21;
        default: return 0;
    }
}

}
