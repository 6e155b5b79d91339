#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "core/codec/codec.hpp"
#include "core/config/input_sources.hpp"
#include "core/util/canonical.hpp"

namespace {

bool write_output_file(const std::string& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

int usage() {
  std::cerr << "usage: score_seal_input guest <out-file>\n"
            << "       score_seal_input submission <out-file> <player> <score> <difficulty>\n";
  return 2;
}

int pack_guest(const std::string& path) {
  seal::GuestInput input;
  const seal::Result resolved =
      seal::resolve_guest_input(seal::InputSources{}, seal::util::unix_timestamp_now(), input);
  if (!resolved.ok) {
    std::cerr << resolved.message << '\n';
    return 1;
  }

  if (!write_output_file(path, seal::codec::encode_guest_input(input))) {
    std::cerr << "Unable to write " << path << '\n';
    return 1;
  }
  std::cout << "Packed guest input: score=" << input.score << " (from " << resolved.data
            << ") session_id=" << input.session_id << " (" << seal::codec::kGuestInputSize
            << " bytes) -> " << path << '\n';
  return 0;
}

int pack_submission(const std::string& path, std::string_view player, std::string_view score_text,
                    std::string_view difficulty_text) {
  const std::optional<std::uint64_t> score = seal::util::parse_u64(score_text);
  const std::optional<std::uint64_t> difficulty = seal::util::parse_u64(difficulty_text);
  if (!score || *score > std::numeric_limits<std::uint32_t>::max()) {
    std::cerr << "Invalid score: " << score_text << '\n';
    return 1;
  }
  if (!difficulty || *difficulty > std::numeric_limits<std::uint8_t>::max()) {
    std::cerr << "Invalid difficulty: " << difficulty_text << '\n';
    return 1;
  }

  const seal::SubmissionInput input{
      .player_id = std::string{player},
      .score = static_cast<std::uint32_t>(*score),
      .difficulty = static_cast<std::uint8_t>(*difficulty),
  };
  std::string bytes;
  const seal::Result encoded = seal::codec::encode_submission_input(input, bytes);
  if (!encoded.ok) {
    std::cerr << encoded.message << '\n';
    return 1;
  }

  if (!write_output_file(path, bytes)) {
    std::cerr << "Unable to write " << path << '\n';
    return 1;
  }
  std::cout << "Packed submission input: player=" << input.player_id << " score=" << input.score
            << " difficulty=" << static_cast<unsigned>(input.difficulty) << " (" << bytes.size()
            << " bytes) -> " << path << '\n';
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    return usage();
  }

  const std::string_view mode{argv[1]};
  if (mode == "guest" && argc == 3) {
    return pack_guest(argv[2]);
  }
  if (mode == "submission" && argc == 6) {
    return pack_submission(argv[2], argv[3], argv[4], argv[5]);
  }
  return usage();
}
