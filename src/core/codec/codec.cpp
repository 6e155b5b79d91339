#include "core/codec/codec.hpp"

#include <utility>

#include "core/util/canonical.hpp"

namespace seal::codec {

void append_le_u32(std::string& out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (i * 8)) & 0xFFU));
  }
}

void append_le_u64(std::string& out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<char>((value >> (i * 8)) & 0xFFULL));
  }
}

std::uint32_t read_le_u32(std::string_view bytes) {
  std::uint32_t value = 0;
  for (int i = 3; i >= 0; --i) {
    value = (value << 8U) | static_cast<unsigned char>(bytes[static_cast<std::size_t>(i)]);
  }
  return value;
}

std::uint64_t read_le_u64(std::string_view bytes) {
  std::uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8U) | static_cast<unsigned char>(bytes[static_cast<std::size_t>(i)]);
  }
  return value;
}

Result decode_guest_input(std::string_view bytes, GuestInput& out) {
  if (bytes.size() != kGuestInputSize) {
    return Result::failure(ErrorKind::MalformedInput,
                           "Invalid input: expected 16 bytes (score + session id), got " +
                               std::to_string(bytes.size()) + ".");
  }

  out.score = read_le_u64(bytes.substr(0, 8));
  out.session_id = read_le_u64(bytes.substr(8, 8));
  return Result::success();
}

std::string encode_guest_input(const GuestInput& input) {
  std::string out;
  out.reserve(kGuestInputSize);
  append_le_u64(out, input.score);
  append_le_u64(out, input.session_id);
  return out;
}

Result decode_submission_input(std::string_view bytes, SubmissionInput& out) {
  if (bytes.empty()) {
    return Result::failure(ErrorKind::MalformedInput, "Invalid input: missing player id length.");
  }

  const std::size_t id_length = static_cast<unsigned char>(bytes[0]);
  const std::size_t required = 1U + id_length + 4U + 1U;
  if (bytes.size() < required) {
    return Result::failure(ErrorKind::MalformedInput,
                           "Invalid input: expected at least " + std::to_string(required) +
                               " bytes for player id length " + std::to_string(id_length) +
                               ", got " + std::to_string(bytes.size()) + ".");
  }

  const std::size_t score_offset = 1U + id_length;
  SubmissionInput decoded;
  decoded.player_id = util::utf8_lossy(bytes.substr(1, id_length));
  decoded.score = read_le_u32(bytes.substr(score_offset, 4));
  decoded.difficulty = static_cast<std::uint8_t>(bytes[score_offset + 4U]);
  out = std::move(decoded);
  return Result::success();
}

Result encode_submission_input(const SubmissionInput& input, std::string& out) {
  if (input.player_id.size() > kMaxPlayerIdBytes) {
    return Result::failure(ErrorKind::MalformedInput,
                           "Player id exceeds 255 bytes and cannot be length-prefixed.");
  }

  std::string encoded;
  encoded.reserve(1U + input.player_id.size() + 5U);
  encoded.push_back(static_cast<char>(input.player_id.size()));
  encoded.append(input.player_id);
  append_le_u32(encoded, input.score);
  encoded.push_back(static_cast<char>(input.difficulty));
  out = std::move(encoded);
  return Result::success();
}

}  // namespace seal::codec
