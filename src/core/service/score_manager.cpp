#include "core/service/score_manager.hpp"

#include <string>
#include <utility>

#include "core/proof/proof_builder.hpp"
#include "core/util/canonical.hpp"

namespace seal {
namespace {

ScoreResponse failed_response(const Result& result) {
  ScoreResponse response;
  response.success = false;
  response.error = result.message;
  response.error_kind = result.kind;
  return response;
}

}  // namespace

ScoreManager::ScoreManager(LeaderboardStore& store, ManagerConfig config)
    : store_(store), config_(config) {}

Result ScoreManager::validate(const ScoreSubmission& submission) const {
  if (util::trim_copy(submission.player_id).empty()) {
    return Result::failure(ErrorKind::ValidationError, "Player ID cannot be empty.");
  }
  if (submission.score == 0) {
    return Result::failure(ErrorKind::ValidationError, "Score must be greater than zero.");
  }
  if (submission.score > config_.max_score) {
    return Result::failure(ErrorKind::ValidationError,
                           "Score " + std::to_string(submission.score) +
                               " exceeds the maximum of " + std::to_string(config_.max_score) + ".");
  }
  if (submission.difficulty > config_.max_difficulty) {
    return Result::failure(ErrorKind::ValidationError,
                           "Invalid difficulty level: " +
                               std::to_string(static_cast<unsigned>(submission.difficulty)) + ".");
  }
  return Result::success();
}

ScoreRecord ScoreManager::make_record(const ScoreSubmission& submission) const {
  ScoreRecord record;
  record.player_id = submission.player_id;
  record.score = submission.score;
  record.timestamp = submission.options.timestamp.value_or(config_.default_timestamp);
  record.session_id = submission.options.session_id.value_or(default_session_id(submission.score));
  record.difficulty = submission.difficulty;
  return record;
}

ScoreResponse ScoreManager::submit(const ScoreSubmission& submission) {
  Result valid = validate(submission);
  if (!valid.ok) {
    return failed_response(valid);
  }

  ScoreProof proof;
  Result built = build_proof(make_record(submission), proof);
  if (!built.ok) {
    return failed_response(built);
  }

  LeaderboardEntry entry;
  entry.player_id = proof.score_data.player_id;
  entry.score = proof.score_data.score;
  entry.difficulty = proof.score_data.difficulty;
  entry.timestamp = proof.score_data.timestamp;
  entry.content_hash = proof.score_data.content_hash;

  std::uint32_t rank = 0;
  Result inserted = store_.insert(entry, rank);
  if (!inserted.ok) {
    return failed_response(inserted);
  }

  ScoreResponse response;
  response.success = true;
  response.proof = std::move(proof);
  response.leaderboard_position = rank;
  return response;
}

ScoreResponse ScoreManager::submit(std::string_view player_id, std::uint32_t score,
                                   std::uint8_t difficulty) {
  return submit(ScoreSubmission{
      .player_id = std::string{player_id},
      .score = score,
      .difficulty = difficulty,
  });
}

bool ScoreManager::verify(const ScoreProof& proof) const {
  return verify_proof(proof);
}

std::vector<LeaderboardEntry> ScoreManager::leaderboard(std::uint8_t difficulty,
                                                        std::size_t limit) const {
  return store_.category(difficulty, limit);
}

std::vector<LeaderboardEntry> ScoreManager::global_leaderboard(std::size_t limit) const {
  return store_.global(limit);
}

PlayerStats ScoreManager::player_stats(std::string_view player_id) const {
  return store_.stats(player_id);
}

}  // namespace seal
