#include "core/config/input_sources.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

#include "core/binder/integrity_binder.hpp"
#include "core/util/canonical.hpp"

namespace seal {
namespace {

constexpr std::uint64_t kFallbackSessionMultiplier = 0x517cc1b727220a95ULL;
constexpr std::uint64_t kSessionScoreMask = 0xFFFFFULL;

std::optional<std::string> read_env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string{value};
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

}  // namespace

Result resolve_score(const InputSources& sources, std::uint64_t& out_score) {
  std::string origin = sources.score_env;
  std::optional<std::string> raw = read_env(sources.score_env);
  if (!raw) {
    origin = sources.score_file;
    raw = read_file(sources.score_file);
  }
  if (!raw) {
    return Result::failure(ErrorKind::MalformedInput,
                           sources.score_env + " not found in environment or " +
                               sources.score_file + ".");
  }

  const std::optional<std::uint64_t> score = util::parse_u64(*raw);
  if (!score) {
    return Result::failure(ErrorKind::MalformedInput, "Invalid score format in " + origin + ".");
  }
  out_score = *score;
  return Result::success("Score read from " + origin + ".", origin);
}

std::uint64_t derive_session_id(std::uint64_t score, std::int64_t now_unix) {
  if (now_unix < 0 || static_cast<std::uint64_t>(now_unix) < kMinSessionEpoch) {
    return score * kFallbackSessionMultiplier;
  }
  return (static_cast<std::uint64_t>(now_unix) << kSessionTimestampShift) |
         (score & kSessionScoreMask);
}

Result resolve_guest_input(const InputSources& sources, std::int64_t now_unix, GuestInput& out) {
  std::uint64_t score = 0;
  Result scored = resolve_score(sources, score);
  if (!scored.ok) {
    return scored;
  }

  std::uint64_t session_id = 0;
  if (const std::optional<std::string> raw = read_env(sources.session_env)) {
    const std::optional<std::uint64_t> parsed = util::parse_u64(*raw);
    if (!parsed) {
      return Result::failure(ErrorKind::MalformedInput,
                             "Invalid session id format in " + sources.session_env + ".");
    }
    session_id = *parsed;
  } else {
    session_id = derive_session_id(score, now_unix);
  }

  out.score = score;
  out.session_id = session_id;
  return scored;
}

}  // namespace seal
