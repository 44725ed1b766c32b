#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mg::crypto {

constexpr size_t SECRETBOX_KEY_SIZE = 32;
constexpr size_t SECRETBOX_NONCE_SIZE = 24;
constexpr size_t SECRETBOX_MAC_SIZE = 16;

void ensureSodiumInit();

// nonce || ciphertext+mac
std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::vector<uint8_t>& key);
std::vector<uint8_t> unseal(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key);

// Reads the key file, creating it (0600) with a random key when absent.
std::vector<uint8_t> loadOrCreateKey(const std::filesystem::path& keyPath);
std::vector<uint8_t> generateKey();

std::vector<uint8_t> read_file(const std::filesystem::path& path);
void write_file_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& data);

std::string b64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> b64_decode(const std::string& b64);

}
