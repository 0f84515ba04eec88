#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gpi {

void secureZero(void* ptr, std::size_t numBytes);

// Owns key material and wipes it with sodium_memzero on destruction and reassignment.
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(std::size_t count) : bytes_(count) {}
    ~SecureBytes() { wipe(); }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    // Decodes hex without leaving a plaintext copy behind. Throws std::invalid_argument.
    static SecureBytes fromHex(const std::string& hex);

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe() {
        if (!bytes_.empty()) {
            secureZero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<unsigned char> bytes_;
};

std::string bytesToHex(const unsigned char* data, std::size_t size);
std::vector<unsigned char> hexToBytes(const std::string& hex);

} // namespace gpi
