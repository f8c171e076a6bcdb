#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ghostlink::crypto {

// CSPRNG helpers backed by libsodium's randombytes.
std::vector<std::uint8_t> random_bytes(std::size_t size);
void random_fill(std::span<std::uint8_t> out);
std::uint64_t random_uint64();
std::uint32_t random_uint32();

}  // namespace ghostlink::crypto
