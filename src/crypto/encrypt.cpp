#include "crypto/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace mg::crypto {

void ensureSodiumInit() {
    static const int rc = sodium_init();
    if (rc < 0) throw std::runtime_error("libsodium initialization failed");
}

std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::vector<uint8_t>& key) {
    ensureSodiumInit();
    if (key.size() != SECRETBOX_KEY_SIZE) {
        log::Registry::creds()->error("[seal] Invalid secretbox key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid secretbox key size");
    }

    std::vector<uint8_t> out(SECRETBOX_NONCE_SIZE + plaintext.size() + SECRETBOX_MAC_SIZE);
    randombytes_buf(out.data(), SECRETBOX_NONCE_SIZE);

    if (crypto_secretbox_easy(out.data() + SECRETBOX_NONCE_SIZE, plaintext.data(), plaintext.size(),
                              out.data(), key.data()) != 0)
        throw std::runtime_error("crypto_secretbox_easy failed");

    return out;
}

std::vector<uint8_t> unseal(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key) {
    ensureSodiumInit();
    if (key.size() != SECRETBOX_KEY_SIZE) throw std::invalid_argument("Invalid secretbox key size");
    if (sealed.size() < SECRETBOX_NONCE_SIZE + SECRETBOX_MAC_SIZE) throw std::runtime_error("Sealed payload too short");

    std::vector<uint8_t> plain(sealed.size() - SECRETBOX_NONCE_SIZE - SECRETBOX_MAC_SIZE);
    if (crypto_secretbox_open_easy(plain.data(), sealed.data() + SECRETBOX_NONCE_SIZE,
                                   sealed.size() - SECRETBOX_NONCE_SIZE, sealed.data(), key.data()) != 0)
        throw std::runtime_error("Decryption failed: authentication error");

    return plain;
}

std::vector<uint8_t> generateKey() {
    ensureSodiumInit();
    std::vector<uint8_t> key(SECRETBOX_KEY_SIZE);
    crypto_secretbox_keygen(key.data());
    return key;
}

std::vector<uint8_t> loadOrCreateKey(const std::filesystem::path& keyPath) {
    if (std::filesystem::exists(keyPath)) {
        auto key = read_file(keyPath);
        if (key.size() != SECRETBOX_KEY_SIZE) throw std::runtime_error("Corrupt key file: " + keyPath.string());
        return key;
    }

    auto key = generateKey();
    write_file_atomic(keyPath, key);
    ::chmod(keyPath.c_str(), S_IRUSR | S_IWUSR);
    log::Registry::creds()->info("[loadOrCreateKey] Generated new key at {}", keyPath.string());
    return key;
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
    }
    std::filesystem::rename(tmp, path);
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    ensureSodiumInit();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.pop_back(); // trailing NUL
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    ensureSodiumInit();
    std::vector<uint8_t> decoded(b64.size());
    size_t decoded_len = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw std::runtime_error("Base64 decode failed");

    decoded.resize(decoded_len);
    return decoded;
}

}
