#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/leaderboard_store.hpp"

namespace seal {

class ScoreManager {
public:
  explicit ScoreManager(LeaderboardStore& store, ManagerConfig config = {});

  // Validate, build the record and its proof, then insert into the store. Nothing is
  // inserted when validation fails.
  ScoreResponse submit(const ScoreSubmission& submission);
  ScoreResponse submit(std::string_view player_id, std::uint32_t score, std::uint8_t difficulty);

  Result validate(const ScoreSubmission& submission) const;
  [[nodiscard]] bool verify(const ScoreProof& proof) const;

  [[nodiscard]] std::vector<LeaderboardEntry> leaderboard(std::uint8_t difficulty,
                                                          std::size_t limit) const;
  [[nodiscard]] std::vector<LeaderboardEntry> global_leaderboard(std::size_t limit) const;
  [[nodiscard]] PlayerStats player_stats(std::string_view player_id) const;

  [[nodiscard]] const ManagerConfig& config() const { return config_; }

private:
  ScoreRecord make_record(const ScoreSubmission& submission) const;

  LeaderboardStore& store_;
  ManagerConfig config_;
};

}  // namespace seal
