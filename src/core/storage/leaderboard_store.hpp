#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace seal {

// Score descending, then timestamp ascending. Content hash and difficulty break the
// remaining ties so the order never depends on insertion order.
[[nodiscard]] bool ranks_before(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs);

class LeaderboardStore {
public:
  struct Options {
    int lock_retry_attempts = 8;
    std::chrono::milliseconds lock_retry_wait{2};
  };

  LeaderboardStore();
  explicit LeaderboardStore(Options options);

  LeaderboardStore(const LeaderboardStore&) = delete;
  LeaderboardStore& operator=(const LeaderboardStore&) = delete;

  // Insert and re-sort the entry's category as one unit. out_rank is 1-indexed.
  Result insert(const LeaderboardEntry& entry, std::uint32_t& out_rank);

  [[nodiscard]] std::vector<LeaderboardEntry> category(std::uint8_t difficulty,
                                                       std::size_t limit) const;
  [[nodiscard]] std::vector<LeaderboardEntry> global(std::size_t limit) const;
  [[nodiscard]] PlayerStats stats(std::string_view player_id) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::uint8_t> categories() const;

private:
  friend struct LeaderboardStoreTestAccess;

  struct Bucket {
    mutable std::shared_timed_mutex mutex;
    std::vector<LeaderboardEntry> entries;
  };

  using Snapshot = std::map<std::uint8_t, std::vector<LeaderboardEntry>>;

  [[nodiscard]] const Bucket* find_bucket(std::uint8_t difficulty) const;
  Bucket& bucket_for(std::uint8_t difficulty);
  [[nodiscard]] Snapshot snapshot() const;

  Options options_;
  mutable std::shared_mutex buckets_mutex_;
  std::map<std::uint8_t, std::unique_ptr<Bucket>> buckets_;
};

}  // namespace seal
