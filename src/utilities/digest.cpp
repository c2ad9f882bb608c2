#include "utilities/digest.hpp"

#include <stdexcept>

namespace sharedict {

Digest::Digest() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&state_);
}

void Digest::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

ChunkHash Digest::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  ChunkHash out;
  crypto_hash_sha256_final(&state_, out.data());
  finalized_ = true;
  return out;
}

ChunkHash Digest::of(std::span<const std::byte> data) {
  Digest d;
  d.ingest(data);
  return d.finalize();
}

std::string toHex(const ChunkHash &hash) {
  // sodium_bin2hex writes 2*len characters plus a terminating NUL
  char buf[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(buf, sizeof(buf), hash.data(), hash.size());
  return std::string(buf, DIGEST_SIZE * 2);
}

ChunkHash fromHex(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::invalid_argument("Invalid hash: expected " +
                                std::to_string(DIGEST_SIZE * 2) +
                                " hex characters, got " +
                                std::to_string(hex.size()));
  }
  ChunkHash out;
  size_t written = 0;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr,
                     &written, nullptr) != 0 ||
      written != DIGEST_SIZE) {
    throw std::invalid_argument("Invalid hash: not a hex string: " + hex);
  }
  return out;
}

} // namespace sharedict
