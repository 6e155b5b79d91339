#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace seal::util {

// SHA-256 over payload. Fails only when libsodium cannot be initialized.
Result sha256_raw(std::string_view payload, std::string& out_digest);
Result sha256_hex(std::string_view payload, std::string& out_hex);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

}  // namespace seal::util
