#include "airmesh/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace airmesh::crypto {

void ensure_sodium_initialized() {
    static const bool initialized = [] {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
        return true;
    }();
    (void)initialized;
}

void random_bytes(std::span<uint8_t> out) {
    ensure_sodium_initialized();
    randombytes_buf(out.data(), out.size());
}

uint64_t random_u64() {
    uint64_t value = 0;
    random_bytes({reinterpret_cast<uint8_t*>(&value), sizeof(value)});
    return value;
}

} // namespace airmesh::crypto
