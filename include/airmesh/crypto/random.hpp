#pragma once

#include <cstdint>
#include <span>

namespace airmesh::crypto {

// Initializes libsodium once per process; throws std::runtime_error on failure
void ensure_sodium_initialized();

void random_bytes(std::span<uint8_t> out);

uint64_t random_u64();

} // namespace airmesh::crypto
