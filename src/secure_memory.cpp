#include "secure_memory.hpp"

#include <sodium.h>

#include <stdexcept>

namespace gpi {

void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }
    sodium_memzero(ptr, numBytes);
}

SecureBytes SecureBytes::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    SecureBytes out(hex.size() / 2);
    std::size_t decoded = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded, nullptr) != 0 ||
        decoded != out.size()) {
        throw std::invalid_argument("invalid hex string");
    }
    return out;
}

std::string bytesToHex(const unsigned char* data, std::size_t size) {
    std::string out(size * 2 + 1, '\0');
    sodium_bin2hex(&out[0], out.size(), data, size);
    out.resize(size * 2);
    return out;
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    std::vector<unsigned char> out(hex.size() / 2);
    std::size_t decoded = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded, nullptr) != 0 ||
        decoded != out.size()) {
        throw std::invalid_argument("invalid hex string");
    }
    return out;
}

} // namespace gpi
