#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

namespace seal::util {
namespace {

bool sodium_ready() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

Result sha256_raw(std::string_view payload, std::string& out_digest) {
  if (!sodium_ready()) {
    return Result::failure(ErrorKind::HashFailure, "libsodium initialization failed.");
  }

  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                         static_cast<unsigned long long>(payload.size())) != 0) {
    return Result::failure(ErrorKind::HashFailure, "crypto_hash_sha256 failed.");
  }
  out_digest.assign(reinterpret_cast<const char*>(digest.data()), digest.size());
  return Result::success();
}

Result sha256_hex(std::string_view payload, std::string& out_hex) {
  std::string digest;
  Result hashed = sha256_raw(payload, digest);
  if (!hashed.ok) {
    return hashed;
  }
  out_hex = to_hex(digest);
  return Result::success();
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return {};
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

}  // namespace seal::util
