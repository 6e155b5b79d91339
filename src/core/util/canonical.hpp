#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seal::util {

std::int64_t unix_timestamp_now();

std::string trim_copy(std::string_view value);

// Decodes bytes as UTF-8, replacing each maximal invalid subsequence with U+FFFD.
std::string utf8_lossy(std::string_view bytes);

std::optional<std::uint64_t> parse_u64(std::string_view text);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

}  // namespace seal::util
