#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace seal::codec {

inline constexpr std::size_t kGuestInputSize = 16;
inline constexpr std::size_t kMaxPlayerIdBytes = 255;

// [0..8) score LE u64, [8..16) session id LE u64. Any other length is MalformedInput.
Result decode_guest_input(std::string_view bytes, GuestInput& out);
std::string encode_guest_input(const GuestInput& input);

// [L:u8][player id: L bytes][score: LE u32][difficulty: u8]. Trailing bytes are ignored.
Result decode_submission_input(std::string_view bytes, SubmissionInput& out);
Result encode_submission_input(const SubmissionInput& input, std::string& out);

void append_le_u32(std::string& out, std::uint32_t value);
void append_le_u64(std::string& out, std::uint64_t value);
std::uint32_t read_le_u32(std::string_view bytes);
std::uint64_t read_le_u64(std::string_view bytes);

}  // namespace seal::codec
