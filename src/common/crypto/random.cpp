#include "common/crypto/random.h"

#include <sodium.h>

#include <stdexcept>

namespace ghostlink::crypto {

namespace {
void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}
}  // namespace

std::vector<std::uint8_t> random_bytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  random_fill(out);
  return out;
}

void random_fill(std::span<std::uint8_t> out) {
  ensure_sodium_ready();
  if (!out.empty()) {
    randombytes_buf(out.data(), out.size());
  }
}

std::uint64_t random_uint64() {
  ensure_sodium_ready();
  std::uint64_t value = 0;
  randombytes_buf(&value, sizeof(value));
  return value;
}

std::uint32_t random_uint32() {
  ensure_sodium_ready();
  return randombytes_random();
}

}  // namespace ghostlink::crypto
