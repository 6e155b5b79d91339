#pragma once

#include <cstdint>
#include <string>

#include "core/model/types.hpp"

namespace seal {

struct InputSources {
  std::string score_env = "GAME_SCORE";
  std::string score_file = "GAME_SCORE.txt";
  std::string session_env = "GAME_SESSION_ID";
};

// Environment variable first, then the file. The first source present wins even if it
// does not parse. On success data names the source that supplied the score.
Result resolve_score(const InputSources& sources, std::uint64_t& out_score);

// (now << 20) | low 20 score bits, or a score-derived id when the clock predates launch.
[[nodiscard]] std::uint64_t derive_session_id(std::uint64_t score, std::int64_t now_unix);

// Forwards resolve_score's source in data.
Result resolve_guest_input(const InputSources& sources, std::int64_t now_unix, GuestInput& out);

}  // namespace seal
