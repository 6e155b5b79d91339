#include "core/storage/leaderboard_store.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>

namespace seal {

bool ranks_before(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.timestamp != rhs.timestamp) {
    return lhs.timestamp < rhs.timestamp;
  }
  if (lhs.content_hash != rhs.content_hash) {
    return lhs.content_hash < rhs.content_hash;
  }
  return lhs.difficulty < rhs.difficulty;
}

LeaderboardStore::LeaderboardStore() : LeaderboardStore(Options{}) {}

LeaderboardStore::LeaderboardStore(Options options) : options_(options) {
  if (options_.lock_retry_attempts < 1) {
    options_.lock_retry_attempts = 1;
  }
}

const LeaderboardStore::Bucket* LeaderboardStore::find_bucket(std::uint8_t difficulty) const {
  std::shared_lock<std::shared_mutex> guard(buckets_mutex_);
  const auto it = buckets_.find(difficulty);
  return it == buckets_.end() ? nullptr : it->second.get();
}

LeaderboardStore::Bucket& LeaderboardStore::bucket_for(std::uint8_t difficulty) {
  {
    std::shared_lock<std::shared_mutex> guard(buckets_mutex_);
    const auto it = buckets_.find(difficulty);
    if (it != buckets_.end()) {
      return *it->second;
    }
  }

  std::unique_lock<std::shared_mutex> guard(buckets_mutex_);
  auto& slot = buckets_[difficulty];
  if (!slot) {
    slot = std::make_unique<Bucket>();
  }
  return *slot;
}

Result LeaderboardStore::insert(const LeaderboardEntry& entry, std::uint32_t& out_rank) {
  if (entry.content_hash.empty()) {
    return Result::failure(ErrorKind::ValidationError, "Leaderboard entry has no content hash.");
  }

  Bucket& bucket = bucket_for(entry.difficulty);
  std::unique_lock<std::shared_timed_mutex> lock(bucket.mutex, std::defer_lock);
  for (int attempt = 0; attempt < options_.lock_retry_attempts && !lock.owns_lock(); ++attempt) {
    lock.try_lock_for(options_.lock_retry_wait);
  }
  if (!lock.owns_lock()) {
    return Result::failure(ErrorKind::LockContention,
                           "Leaderboard category " + std::to_string(entry.difficulty) +
                               " is busy after " + std::to_string(options_.lock_retry_attempts) +
                               " attempts.");
  }

  const auto duplicate = std::ranges::find_if(bucket.entries, [&](const LeaderboardEntry& e) {
    return e.content_hash == entry.content_hash;
  });
  if (duplicate != bucket.entries.end()) {
    return Result::failure(ErrorKind::CollisionError,
                           "Content hash already recorded: " + entry.content_hash);
  }

  bucket.entries.push_back(entry);
  std::ranges::sort(bucket.entries, ranks_before);

  const auto position = std::ranges::find_if(bucket.entries, [&](const LeaderboardEntry& e) {
    return e.content_hash == entry.content_hash;
  });
  out_rank = static_cast<std::uint32_t>(position - bucket.entries.begin()) + 1U;
  return Result::success();
}

std::vector<LeaderboardEntry> LeaderboardStore::category(std::uint8_t difficulty,
                                                         std::size_t limit) const {
  const Bucket* bucket = find_bucket(difficulty);
  if (bucket == nullptr) {
    return {};
  }

  std::shared_lock<std::shared_timed_mutex> lock(bucket->mutex);
  const std::size_t count = std::min(limit, bucket->entries.size());
  return std::vector<LeaderboardEntry>(
      bucket->entries.begin(), bucket->entries.begin() + static_cast<std::ptrdiff_t>(count));
}

LeaderboardStore::Snapshot LeaderboardStore::snapshot() const {
  std::shared_lock<std::shared_mutex> guard(buckets_mutex_);

  // Hold every category at once so cross-category reads see one consistent state.
  std::vector<std::shared_lock<std::shared_timed_mutex>> locks;
  locks.reserve(buckets_.size());
  for (const auto& [difficulty, bucket] : buckets_) {
    locks.emplace_back(bucket->mutex);
  }

  Snapshot copy;
  for (const auto& [difficulty, bucket] : buckets_) {
    copy.emplace(difficulty, bucket->entries);
  }
  return copy;
}

std::vector<LeaderboardEntry> LeaderboardStore::global(std::size_t limit) const {
  std::vector<LeaderboardEntry> merged;
  for (auto& [difficulty, entries] : snapshot()) {
    merged.insert(merged.end(), std::make_move_iterator(entries.begin()),
                  std::make_move_iterator(entries.end()));
  }

  std::ranges::sort(merged, ranks_before);
  if (merged.size() > limit) {
    merged.resize(limit);
  }
  return merged;
}

PlayerStats LeaderboardStore::stats(std::string_view player_id) const {
  PlayerStats stats;
  stats.player_id = std::string{player_id};

  std::uint64_t total_score = 0;
  for (const auto& [difficulty, entries] : snapshot()) {
    DifficultyStats breakdown;
    std::uint64_t category_total = 0;
    for (const auto& entry : entries) {
      if (entry.player_id != player_id) {
        continue;
      }
      ++breakdown.games_played;
      breakdown.highest_score = std::max(breakdown.highest_score, entry.score);
      category_total += entry.score;
    }
    if (breakdown.games_played == 0) {
      continue;
    }

    breakdown.average_score =
        static_cast<double>(category_total) / static_cast<double>(breakdown.games_played);
    stats.total_games += breakdown.games_played;
    stats.highest_score = std::max(stats.highest_score, breakdown.highest_score);
    total_score += category_total;
    stats.difficulty_breakdown.emplace(difficulty, breakdown);
  }

  if (stats.total_games > 0) {
    stats.average_score = static_cast<double>(total_score) / static_cast<double>(stats.total_games);
  }
  return stats;
}

std::size_t LeaderboardStore::size() const {
  std::size_t total = 0;
  for (const auto& [difficulty, entries] : snapshot()) {
    total += entries.size();
  }
  return total;
}

std::vector<std::uint8_t> LeaderboardStore::categories() const {
  std::shared_lock<std::shared_mutex> guard(buckets_mutex_);
  std::vector<std::uint8_t> keys;
  keys.reserve(buckets_.size());
  for (const auto& [difficulty, bucket] : buckets_) {
    keys.push_back(difficulty);
  }
  return keys;
}

}  // namespace seal
