#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace seal {

enum class ErrorKind {
  None,
  MalformedInput,
  ValidationError,
  CollisionError,
  LockContention,
  HashFailure,
};

struct Result {
  bool ok = false;
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorKind kind, std::string msg) {
    return {false, kind, std::move(msg), {}};
  }
};

const char* error_kind_name(ErrorKind kind);

// Guest-environment input: two little-endian u64 words.
struct GuestInput {
  std::uint64_t score = 0;
  std::uint64_t session_id = 0;
};

// Host-environment input: length-prefixed player id, u32 score, u8 difficulty.
struct SubmissionInput {
  std::string player_id;
  std::uint32_t score = 0;
  std::uint8_t difficulty = 0;
};

struct BindingOutput {
  std::uint64_t score = 0;
  std::uint64_t session_id = 0;
  std::uint32_t binding = 0;
  std::uint64_t verification_mix = 0;
  std::uint32_t final_check = 0;
};

inline constexpr std::size_t kGuestSlotCount = 8;
inline constexpr std::uint64_t kFixedRecordTimestamp = 1234567890ULL;
using GuestSlots = std::array<std::uint32_t, kGuestSlotCount>;

struct ScoreRecord {
  std::string player_id;
  std::uint32_t score = 0;
  std::uint64_t timestamp = 0;
  std::string session_id;
  std::uint8_t difficulty = 0;
  std::string content_hash;
};

struct ScoreProof {
  ScoreRecord score_data;
  std::string root_hash;
  std::vector<std::string> proof_path;
  std::vector<std::uint8_t> public_inputs;
};

struct LeaderboardEntry {
  std::string player_id;
  std::uint32_t score = 0;
  std::uint8_t difficulty = 0;
  std::uint64_t timestamp = 0;
  std::string content_hash;
};

struct DifficultyStats {
  std::uint32_t games_played = 0;
  std::uint32_t highest_score = 0;
  double average_score = 0.0;
};

struct PlayerStats {
  std::string player_id;
  std::uint32_t total_games = 0;
  std::uint32_t highest_score = 0;
  double average_score = 0.0;
  std::map<std::uint8_t, DifficultyStats> difficulty_breakdown;
};

struct SubmissionOptions {
  std::optional<std::string> session_id;  // absent -> "session_<score>"
  std::optional<std::uint64_t> timestamp; // absent -> ManagerConfig::default_timestamp
};

struct ScoreSubmission {
  std::string player_id;
  std::uint32_t score = 0;
  std::uint8_t difficulty = 0;
  SubmissionOptions options{};
};

struct ScoreResponse {
  bool success = false;
  std::optional<ScoreProof> proof;
  std::string error;
  ErrorKind error_kind = ErrorKind::None;
  std::optional<std::uint32_t> leaderboard_position;
};

struct ManagerConfig {
  std::uint64_t default_timestamp = kFixedRecordTimestamp;
  std::uint32_t max_score = 1'000'000U;
  std::uint8_t max_difficulty = 10;
};

}  // namespace seal
