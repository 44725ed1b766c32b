#pragma once

#include <string>

namespace mg::crypto::hash {

std::string sha256Hex(const std::string& data);

}
