#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mg::types {

enum class Protocol { Local, SMB, SFTP, FTP, Cloud };

std::string to_string(Protocol p);
std::string schemeOf(Protocol p);
std::optional<Protocol> protocolFromScheme(std::string_view scheme);
std::optional<Protocol> protocolFromString(std::string_view name);

uint16_t defaultPort(Protocol p);

}
