#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/binder/integrity_binder.hpp"
#include "core/codec/codec.hpp"
#include "core/config/input_sources.hpp"
#include "core/proof/proof_builder.hpp"
#include "core/service/score_manager.hpp"
#include "core/storage/leaderboard_store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace seal {

struct LeaderboardStoreTestAccess {
  static std::shared_timed_mutex& category_mutex(LeaderboardStore& store, std::uint8_t difficulty) {
    return store.bucket_for(difficulty).mutex;
  }
};

}  // namespace seal

namespace {

constexpr std::uint64_t kLaunchSession = (seal::kMinSessionEpoch << 20U) | 100U;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "score-seal-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

seal::LeaderboardEntry make_entry(std::string player, std::uint32_t score, std::uint64_t timestamp,
                                  std::uint8_t difficulty, std::string hash) {
  seal::LeaderboardEntry entry;
  entry.player_id = std::move(player);
  entry.score = score;
  entry.timestamp = timestamp;
  entry.difficulty = difficulty;
  entry.content_hash = std::move(hash);
  return entry;
}

bool is_ranked(const std::vector<seal::LeaderboardEntry>& entries) {
  return std::is_sorted(entries.begin(), entries.end(), seal::ranks_before);
}

int popcount32(std::uint32_t value) {
  int bits = 0;
  while (value != 0) {
    bits += static_cast<int>(value & 1U);
    value >>= 1U;
  }
  return bits;
}

seal::ScoreRecord alice_record() {
  seal::ScoreRecord record;
  record.player_id = "Alice";
  record.score = 100;
  record.timestamp = seal::kFixedRecordTimestamp;
  record.session_id = "session_100";
  record.difficulty = 1;
  return record;
}

void test_sha256_known_answer() {
  std::string hex;
  const seal::Result hashed = seal::util::sha256_hex("abc", hex);
  assert(hashed.ok);
  assert(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(seal::util::from_hex(seal::util::to_hex("\x01\xff")) == "\x01\xff");
  assert(seal::util::from_hex("abc").empty());
}

void test_guest_codec_layout() {
  const seal::GuestInput input{.score = 0x0102030405060708ULL, .session_id = kLaunchSession};
  const std::string bytes = seal::codec::encode_guest_input(input);
  assert(bytes.size() == 16);
  assert(static_cast<unsigned char>(bytes[0]) == 0x08);
  assert(static_cast<unsigned char>(bytes[7]) == 0x01);

  seal::GuestInput decoded;
  seal::Result result = seal::codec::decode_guest_input(bytes, decoded);
  assert(result.ok);
  assert(decoded.score == input.score);
  assert(decoded.session_id == input.session_id);

  result = seal::codec::decode_guest_input(bytes.substr(0, 15), decoded);
  assert(!result.ok);
  assert(result.kind == seal::ErrorKind::MalformedInput);

  result = seal::codec::decode_guest_input(bytes + "x", decoded);
  assert(result.kind == seal::ErrorKind::MalformedInput);
}

void test_submission_codec_layout() {
  std::string bytes;
  seal::Result result = seal::codec::encode_submission_input(
      {.player_id = "Alice", .score = 250, .difficulty = 3}, bytes);
  assert(result.ok);
  assert(bytes.size() == 1 + 5 + 4 + 1);
  assert(bytes[0] == 5);
  assert(bytes.substr(1, 5) == "Alice");
  assert(static_cast<unsigned char>(bytes[6]) == 250);
  assert(bytes[10] == 3);

  seal::SubmissionInput decoded;
  result = seal::codec::decode_submission_input(bytes, decoded);
  assert(result.ok);
  assert(decoded.player_id == "Alice");
  assert(decoded.score == 250);
  assert(decoded.difficulty == 3);

  result = seal::codec::decode_submission_input(bytes.substr(0, 10), decoded);
  assert(result.kind == seal::ErrorKind::MalformedInput);
  assert(decoded.player_id == "Alice");
  result = seal::codec::decode_submission_input({}, decoded);
  assert(result.kind == seal::ErrorKind::MalformedInput);

  const std::string invalid_utf8("\x04\xff" "a" "\xe2\x82" "\x01\x00\x00\x00" "\x02", 10);
  result = seal::codec::decode_submission_input(invalid_utf8, decoded);
  assert(result.ok);
  assert(decoded.player_id == "\xEF\xBF\xBD" "a" "\xEF\xBF\xBD");
  assert(decoded.score == 1);
  assert(decoded.difficulty == 2);

  result = seal::codec::encode_submission_input(
      {.player_id = std::string(256, 'p'), .score = 1, .difficulty = 1}, bytes);
  assert(result.kind == seal::ErrorKind::MalformedInput);
}

void test_utf8_lossy() {
  assert(seal::util::utf8_lossy("plain") == "plain");
  assert(seal::util::utf8_lossy("caf\xC3\xA9") == "caf\xC3\xA9");
  assert(seal::util::utf8_lossy("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
  assert(seal::util::utf8_lossy("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
  assert(seal::util::utf8_lossy("\xF0\x9F\x98\x80") == "\xF0\x9F\x98\x80");
}

void test_binding_known_vectors() {
  assert(kLaunchSession == 1782579200000100ULL);
  assert(seal::proof_binding(100, kLaunchSession) == 478373795U);
  assert(seal::proof_binding(1, 1ULL << 52U) == 2112388046U);
  assert(seal::verification_mix(100, kLaunchSession) == 2385090969603267400ULL);
  assert(seal::final_check(478373795U, 2385090969603267400ULL) == 3165995755U);
  assert(seal::final_check(0xFFFFFFFFU, 0) == 0U);
}

void test_binding_avalanche() {
  const std::uint32_t base = seal::proof_binding(500, kLaunchSession);
  assert(base == seal::proof_binding(500, kLaunchSession));

  int total_flipped = 0;
  int samples = 0;
  for (unsigned bit = 0; bit < 64; ++bit) {
    const std::uint32_t from_score = seal::proof_binding(500ULL ^ (1ULL << bit), kLaunchSession);
    const std::uint32_t from_session = seal::proof_binding(500, kLaunchSession ^ (1ULL << bit));
    assert(from_score != base);
    assert(from_session != base);
    total_flipped += popcount32(from_score ^ base) + popcount32(from_session ^ base);
    samples += 2;
  }
  const double mean = static_cast<double>(total_flipped) / samples;
  assert(mean > 12.0 && mean < 20.0);
}

void test_guest_validation_order() {
  assert(seal::first_guest_violation(0, kLaunchSession) == seal::GuestViolation::ScoreOutOfRange);
  assert(seal::first_guest_violation(1001, kLaunchSession) == seal::GuestViolation::ScoreOutOfRange);
  assert(seal::first_guest_violation(0, 0) == seal::GuestViolation::ScoreOutOfRange);
  assert(seal::first_guest_violation(1, 0) == seal::GuestViolation::SessionIdZero);
  assert(seal::first_guest_violation(1000, (seal::kMinSessionEpoch << 20U) - 1U) ==
         seal::GuestViolation::SessionBeforeEpoch);
  assert(seal::first_guest_violation(1, seal::kMinSessionEpoch << 20U) == seal::GuestViolation::None);
  assert(seal::first_guest_violation(1000, kLaunchSession) == seal::GuestViolation::None);

  const seal::Result zero_session = seal::validate_guest_fields(42, 0);
  assert(!zero_session.ok);
  assert(zero_session.kind == seal::ErrorKind::ValidationError);
  const seal::Result high_score = seal::validate_guest_fields(1001, kLaunchSession);
  assert(high_score.kind == seal::ErrorKind::ValidationError);
  assert(high_score.message != zero_session.message);
}

void test_guest_binding_slots() {
  const std::string bytes = seal::codec::encode_guest_input({.score = 100, .session_id = kLaunchSession});

  seal::BindingOutput output;
  seal::Result bound = seal::bind_guest_input(bytes, output);
  assert(bound.ok);
  assert(output.binding == 478373795U);

  const seal::GuestSlots basic = seal::guest_output_slots(output, false);
  assert(basic[0] == 100U);
  assert(basic[1] == 0U);
  assert(basic[2] == static_cast<std::uint32_t>(kLaunchSession & 0xFFFFFFFFULL));
  assert(basic[3] == static_cast<std::uint32_t>(kLaunchSession >> 32U));
  assert(basic[4] == 478373795U);
  assert(basic[5] == 0U && basic[6] == 0U && basic[7] == 0U);

  const seal::GuestSlots extended = seal::guest_output_slots(output, true);
  assert(extended[5] == 2687621960U);
  assert(extended[6] == 555322265U);
  assert(extended[7] == 3165995755U);

  seal::BindingOutput untouched;
  bound = seal::bind_guest_input(bytes.substr(0, 15), untouched);
  assert(bound.kind == seal::ErrorKind::MalformedInput);
  assert(untouched.binding == 0U);

  bound = seal::bind_guest_input(seal::codec::encode_guest_input({.score = 5, .session_id = 0}),
                                 untouched);
  assert(bound.kind == seal::ErrorKind::ValidationError);
  bound = seal::bind_guest_input(
      seal::codec::encode_guest_input({.score = 1001, .session_id = kLaunchSession}), untouched);
  assert(bound.kind == seal::ErrorKind::ValidationError);
}

void test_proof_fields() {
  seal::ScoreRecord record = alice_record();
  record.content_hash = "caller-supplied";

  seal::ScoreProof proof;
  const seal::Result built = seal::build_proof(record, proof);
  assert(built.ok);
  assert(proof.score_data.content_hash ==
         "61d882ee1432a46d324d912009a1b95f3d04646e96093b028e6189c1d691ae48");
  assert(proof.root_hash == "50010fe2f7e1bd1d7b57549be339d09a8febfec4255623c71757c121d6a17bb8");
  assert(proof.proof_path.size() == seal::kProofPathLength);
  assert(proof.proof_path[0] == proof.score_data.content_hash);
  assert(proof.proof_path[1] == "5757f630493b5f652e70ec464c4f27a4e541350ab6ac679e53b3d1ab1157ef46");
  assert(proof.proof_path[2] == "4bf5122f344554c53bde2ebb8cd2b7e3d1600ad631c385a5d7cce23c7785459a");

  const std::string public_inputs(proof.public_inputs.begin(), proof.public_inputs.end());
  assert(proof.public_inputs.size() == seal::kPublicInputsSize);
  assert(seal::util::to_hex(public_inputs) == "6400000001d202964900000000");

  seal::ScoreProof again;
  assert(seal::build_proof(alice_record(), again).ok);
  assert(again.score_data.content_hash == proof.score_data.content_hash);
  assert(again.root_hash == proof.root_hash);
}

void test_proof_verification_detects_tampering() {
  seal::ScoreProof proof;
  assert(seal::build_proof(alice_record(), proof).ok);
  assert(seal::verify_proof(proof));
  assert(seal::verify_proof_chain(proof));

  auto tampered = proof;
  tampered.score_data.player_id = "Mallory";
  assert(!seal::verify_proof(tampered));
  tampered = proof;
  tampered.score_data.score = 101;
  assert(!seal::verify_proof(tampered));
  tampered = proof;
  tampered.score_data.timestamp += 1;
  assert(!seal::verify_proof(tampered));
  tampered = proof;
  tampered.score_data.session_id = "session_101";
  assert(!seal::verify_proof(tampered));
  tampered = proof;
  tampered.score_data.difficulty = 2;
  assert(!seal::verify_proof(tampered));
  tampered = proof;
  tampered.score_data.content_hash[0] = tampered.score_data.content_hash[0] == '0' ? '1' : '0';
  assert(!seal::verify_proof(tampered));

  tampered = proof;
  tampered.root_hash[0] = tampered.root_hash[0] == '0' ? '1' : '0';
  assert(seal::verify_proof(tampered));
  assert(!seal::verify_proof_chain(tampered));
  tampered = proof;
  tampered.public_inputs[0] ^= 0x01U;
  assert(!seal::verify_proof_chain(tampered));
  tampered = proof;
  tampered.proof_path.pop_back();
  assert(!seal::verify_proof_chain(tampered));
}

void test_proof_serialization() {
  seal::ScoreRecord record = alice_record();
  record.player_id = "Alice\nthe=Great\\";
  seal::ScoreProof proof;
  assert(seal::build_proof(record, proof).ok);

  const std::string text = seal::serialize_proof(proof);
  seal::ScoreProof parsed;
  seal::Result result = seal::parse_proof(text, parsed);
  assert(result.ok);
  assert(parsed.score_data.player_id == record.player_id);
  assert(parsed.proof_path == proof.proof_path);
  assert(parsed.public_inputs == proof.public_inputs);
  assert(seal::verify_proof_chain(parsed));

  result = seal::parse_proof("score=1\n", parsed);
  assert(result.kind == seal::ErrorKind::MalformedInput);

  std::string bad_score = text;
  const auto at = bad_score.find("score=100");
  assert(at != std::string::npos);
  bad_score.replace(at, 9, "score=abc");
  result = seal::parse_proof(bad_score, parsed);
  assert(result.kind == seal::ErrorKind::MalformedInput);
}

void test_submission_guest_slots() {
  std::string bytes;
  assert(seal::codec::encode_submission_input({.player_id = "Alice", .score = 100, .difficulty = 1},
                                              bytes)
             .ok);

  seal::GuestSlots slots{};
  seal::ScoreProof proof;
  const seal::Result sealed = seal::seal_submission_input(bytes, slots, &proof);
  assert(sealed.ok);
  assert(proof.score_data.session_id == "session_100");
  assert(slots[0] == 100U);
  assert(slots[1] == 1U);
  assert(slots[2] == 1234567890U);
  assert(slots[3] == 0U);
  assert(slots[4] == 1342246882U);
  assert(slots[5] == 4158766365U);
  assert(slots[6] == 2069320859U);
  assert(slots[7] == 3812216986U);

  assert(seal::seal_submission_input(bytes.substr(0, 4), slots, nullptr).kind ==
         seal::ErrorKind::MalformedInput);
}

void test_store_ranks() {
  seal::LeaderboardStore store;
  std::uint32_t rank = 0;

  assert(store.insert(make_entry("a", 50, 10, 2, "h-a"), rank).ok);
  assert(rank == 1);
  assert(store.insert(make_entry("b", 80, 10, 2, "h-b"), rank).ok);
  assert(rank == 1);
  assert(store.insert(make_entry("c", 10, 10, 2, "h-c"), rank).ok);
  assert(rank == 3);
  assert(store.insert(make_entry("d", 50, 5, 2, "h-d"), rank).ok);
  assert(rank == 2);
  assert(store.insert(make_entry("e", 50, 20, 2, "h-e"), rank).ok);
  assert(rank == 4);

  const auto board = store.category(2, 10);
  assert(board.size() == 5);
  assert(is_ranked(board));
  assert(board[0].player_id == "b");
  assert(board[1].player_id == "d");
  assert(board[2].player_id == "a");
  assert(board[3].player_id == "e");
  assert(board[4].player_id == "c");

  assert(store.category(2, 2).size() == 2);
  assert(store.category(2, 0).empty());
  assert(store.category(7, 10).empty());

  const seal::Result missing_hash = store.insert(make_entry("f", 1, 1, 2, ""), rank);
  assert(missing_hash.kind == seal::ErrorKind::ValidationError);
  assert(store.size() == 5);
}

void test_store_order_is_permutation_independent() {
  std::vector<seal::LeaderboardEntry> entries = {
      make_entry("p1", 30, 3, 4, "h1"), make_entry("p2", 30, 3, 4, "h2"),
      make_entry("p3", 90, 7, 4, "h3"), make_entry("p4", 30, 1, 4, "h4"),
      make_entry("p5", 5, 0, 4, "h5"),
  };
  std::sort(entries.begin(), entries.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.content_hash < rhs.content_hash; });

  std::vector<std::string> expected;
  bool first = true;
  do {
    seal::LeaderboardStore store;
    for (const auto& entry : entries) {
      std::uint32_t rank = 0;
      assert(store.insert(entry, rank).ok);
    }
    std::vector<std::string> order;
    for (const auto& entry : store.category(4, 10)) {
      order.push_back(entry.content_hash);
    }
    if (first) {
      expected = order;
      first = false;
    }
    assert(order == expected);
  } while (std::next_permutation(
      entries.begin(), entries.end(),
      [](const auto& lhs, const auto& rhs) { return lhs.content_hash < rhs.content_hash; }));

  assert((expected == std::vector<std::string>{"h3", "h4", "h1", "h2", "h5"}));
}

void test_store_collision() {
  seal::LeaderboardStore store;
  std::uint32_t rank = 0;
  assert(store.insert(make_entry("a", 10, 1, 0, "same"), rank).ok);
  rank = 99;
  const seal::Result collision = store.insert(make_entry("b", 20, 2, 0, "same"), rank);
  assert(!collision.ok);
  assert(collision.kind == seal::ErrorKind::CollisionError);
  assert(rank == 99);
  assert(store.size() == 1);
  assert(store.category(0, 10).front().player_id == "a");
}

void test_store_ties_use_full_timestamp_range() {
  constexpr std::uint64_t kLateTimestamp = (1ULL << 63U) + 5U;
  seal::LeaderboardStore store;
  std::uint32_t rank = 0;
  assert(store.insert(make_entry("early", 70, 1, 1, "ts-early"), rank).ok);
  assert(rank == 1);
  assert(store.insert(make_entry("late", 70, kLateTimestamp, 1, "ts-late"), rank).ok);
  assert(rank == 2);

  const auto board = store.category(1, 10);
  assert(board[0].player_id == "early");
  assert(board[1].player_id == "late");
  assert(board[1].timestamp == kLateTimestamp);

  seal::LeaderboardStore manager_store;
  seal::ScoreManager manager(manager_store);
  assert(manager.submit("early", 70, 1).success);
  const seal::ScoreResponse late = manager.submit({
      .player_id = "late",
      .score = 70,
      .difficulty = 1,
      .options = {.timestamp = kLateTimestamp},
  });
  assert(late.success);
  assert(late.leaderboard_position == 2U);
  assert(manager.leaderboard(1, 10).back().timestamp == kLateTimestamp);
}

void test_store_lock_contention() {
  seal::LeaderboardStore store({.lock_retry_attempts = 1, .lock_retry_wait = std::chrono::milliseconds{1}});
  std::uint32_t rank = 0;
  assert(store.insert(make_entry("a", 10, 1, 4, "held-a"), rank).ok);

  std::unique_lock<std::shared_timed_mutex> held(
      seal::LeaderboardStoreTestAccess::category_mutex(store, 4));
  seal::Result blocked;
  rank = 77;
  std::thread writer([&] { blocked = store.insert(make_entry("b", 20, 2, 4, "held-b"), rank); });
  writer.join();
  assert(!blocked.ok);
  assert(blocked.kind == seal::ErrorKind::LockContention);
  assert(rank == 77);

  // Other categories keep accepting writes.
  std::uint32_t other_rank = 0;
  assert(store.insert(make_entry("c", 5, 1, 5, "free-c"), other_rank).ok);
  assert(other_rank == 1);

  held.unlock();
  assert(store.size() == 2);
  assert(store.category(4, 10).size() == 1);
  assert(store.category(4, 10).front().content_hash == "held-a");

  assert(store.insert(make_entry("b", 20, 2, 4, "held-b"), rank).ok);
  assert(rank == 1);
}

void test_store_global_and_stats() {
  seal::LeaderboardStore store;
  std::uint32_t rank = 0;
  assert(store.insert(make_entry("alice", 100, 5, 1, "x1"), rank).ok);
  assert(store.insert(make_entry("alice", 300, 6, 1, "x2"), rank).ok);
  assert(store.insert(make_entry("bob", 200, 1, 2, "x3"), rank).ok);
  assert(store.insert(make_entry("alice", 50, 2, 3, "x4"), rank).ok);
  assert(store.insert(make_entry("carol", 300, 4, 3, "x5"), rank).ok);

  const auto global = store.global(10);
  assert(global.size() == 5);
  assert(is_ranked(global));
  assert(global[0].content_hash == "x5");
  assert(global[1].content_hash == "x2");
  assert(global[2].content_hash == "x3");
  assert(store.global(2).size() == 2);
  assert((store.categories() == std::vector<std::uint8_t>{1, 2, 3}));

  const seal::PlayerStats alice = store.stats("alice");
  assert(alice.total_games == 3);
  assert(alice.highest_score == 300);
  assert(alice.average_score == 150.0);
  assert(alice.difficulty_breakdown.size() == 2);
  assert(alice.difficulty_breakdown.at(1).games_played == 2);
  assert(alice.difficulty_breakdown.at(1).highest_score == 300);
  assert(alice.difficulty_breakdown.at(1).average_score == 200.0);
  assert(alice.difficulty_breakdown.at(3).average_score == 50.0);

  const seal::PlayerStats nobody = store.stats("nobody");
  assert(nobody.player_id == "nobody");
  assert(nobody.total_games == 0);
  assert(nobody.highest_score == 0);
  assert(nobody.average_score == 0.0);
  assert(nobody.difficulty_breakdown.empty());
}

void test_store_concurrent_inserts() {
  seal::LeaderboardStore store({.lock_retry_attempts = 1000, .lock_retry_wait = std::chrono::milliseconds{5}});
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&store, t] {
      for (int i = 0; i < kPerThread; ++i) {
        std::uint32_t rank = 0;
        const auto difficulty = static_cast<std::uint8_t>(i % 3);
        const seal::Result inserted = store.insert(
            make_entry("p" + std::to_string(t), static_cast<std::uint32_t>((i * 37 + t) % 500 + 1),
                       i, difficulty, "t" + std::to_string(t) + "-" + std::to_string(i)),
            rank);
        assert(inserted.ok);
        assert(rank >= 1);
        assert(is_ranked(store.global(5)));
        assert(is_ranked(store.category(difficulty, 1000)));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(store.size() == static_cast<std::size_t>(kThreads * kPerThread));
  for (std::uint8_t difficulty = 0; difficulty < 3; ++difficulty) {
    assert(is_ranked(store.category(difficulty, 1000)));
  }
  assert(is_ranked(store.global(1000)));
  assert(store.stats("p3").total_games == static_cast<std::uint32_t>(kPerThread));
}

void test_manager_scenario() {
  seal::LeaderboardStore store;
  seal::ScoreManager manager(store);

  const seal::ScoreResponse alice = manager.submit("Alice", 100, 1);
  assert(alice.success);
  assert(alice.error.empty());
  assert(alice.leaderboard_position == 1U);
  assert(alice.proof.has_value());
  assert(alice.proof->score_data.timestamp == seal::kFixedRecordTimestamp);
  assert(alice.proof->score_data.session_id == "session_100");
  assert(manager.verify(*alice.proof));

  const seal::ScoreResponse bob = manager.submit("Bob", 250, 1);
  assert(bob.success);
  assert(bob.leaderboard_position == 1U);

  const auto board = manager.leaderboard(1, 10);
  assert(board.size() == 2);
  assert(board[0].player_id == "Bob");
  assert(board[1].player_id == "Alice");

  const seal::PlayerStats stats = manager.player_stats("Alice");
  assert(stats.total_games == 1);
  assert(stats.highest_score == 100);

  auto forged = *bob.proof;
  forged.score_data.score = 999;
  assert(!manager.verify(forged));
  assert(manager.global_leaderboard(1).front().player_id == "Bob");
}

void test_manager_validation() {
  seal::LeaderboardStore store;
  seal::ScoreManager manager(store);

  seal::ScoreResponse response = manager.submit("   ", 10, 1);
  assert(!response.success);
  assert(response.error_kind == seal::ErrorKind::ValidationError);
  assert(!response.error.empty());
  assert(!response.proof.has_value());
  assert(!response.leaderboard_position.has_value());

  assert(manager.submit("Alice", 1'000'001, 1).error_kind == seal::ErrorKind::ValidationError);
  assert(manager.submit("Alice", 0, 1).error_kind == seal::ErrorKind::ValidationError);
  assert(manager.submit("Alice", 10, 11).error_kind == seal::ErrorKind::ValidationError);
  assert(store.size() == 0);

  assert(manager.submit("Alice", 1'000'000, 10).success);
  assert(store.size() == 1);

  seal::LeaderboardStore strict_store;
  seal::ScoreManager strict(strict_store, {.max_score = 500, .max_difficulty = 2});
  assert(strict.submit("Alice", 501, 1).error_kind == seal::ErrorKind::ValidationError);
  assert(strict.submit("Alice", 10, 3).error_kind == seal::ErrorKind::ValidationError);
  assert(strict_store.size() == 0);
}

void test_manager_collision_and_options() {
  seal::LeaderboardStore store;
  seal::ScoreManager manager(store);

  const seal::ScoreResponse first = manager.submit("Carol", 40, 2);
  const seal::ScoreResponse second = manager.submit("Carol", 40, 2);
  assert(first.success);
  assert(!second.success);
  assert(second.error_kind == seal::ErrorKind::CollisionError);
  assert(store.size() == 1);

  const seal::ScoreResponse distinct = manager.submit({
      .player_id = "Carol",
      .score = 40,
      .difficulty = 2,
      .options = {.session_id = "run-2", .timestamp = 1700000123ULL},
  });
  assert(distinct.success);
  assert(distinct.proof->score_data.session_id == "run-2");
  assert(distinct.proof->score_data.timestamp == 1700000123ULL);
  assert(distinct.proof->score_data.content_hash != first.proof->score_data.content_hash);
  assert(distinct.leaderboard_position == 2U);
  assert(store.size() == 2);

  seal::ScoreManager later(store, {.default_timestamp = 42});
  const seal::ScoreResponse early = later.submit("Dave", 40, 2);
  assert(early.success);
  assert(early.leaderboard_position == 1U);
}

void test_input_sources() {
  const auto dir = temp_dir("input-sources");
  const seal::InputSources sources{
      .score_env = "SCORE_SEAL_TEST_SCORE",
      .score_file = (dir / "GAME_SCORE.txt").string(),
      .session_env = "SCORE_SEAL_TEST_SESSION",
  };
  ::unsetenv(sources.score_env.c_str());
  ::unsetenv(sources.session_env.c_str());

  std::uint64_t score = 0;
  assert(seal::resolve_score(sources, score).kind == seal::ErrorKind::MalformedInput);

  {
    std::ofstream out(sources.score_file);
    out << "  321\n";
  }
  seal::Result resolved = seal::resolve_score(sources, score);
  assert(resolved.ok);
  assert(score == 321);
  assert(resolved.data == sources.score_file);

  ::setenv(sources.score_env.c_str(), "77", 1);
  resolved = seal::resolve_score(sources, score);
  assert(resolved.ok);
  assert(score == 77);
  assert(resolved.data == sources.score_env);

  ::setenv(sources.score_env.c_str(), "seventy", 1);
  assert(seal::resolve_score(sources, score).kind == seal::ErrorKind::MalformedInput);
  ::setenv(sources.score_env.c_str(), "77", 1);

  const std::int64_t now = 1760000000;
  seal::GuestInput input;
  const seal::Result guest = seal::resolve_guest_input(sources, now, input);
  assert(guest.ok);
  assert(guest.data == sources.score_env);
  assert(input.score == 77);
  assert(input.session_id == ((static_cast<std::uint64_t>(now) << 20U) | 77U));
  assert(seal::validate_guest_fields(input.score, input.session_id).ok);

  assert(seal::derive_session_id(77, 1000) == 77ULL * 0x517cc1b727220a95ULL);
  assert(seal::derive_session_id(0x123456, now) ==
         ((static_cast<std::uint64_t>(now) << 20U) | 0x23456U));

  ::setenv(sources.session_env.c_str(), "12345", 1);
  assert(seal::resolve_guest_input(sources, now, input).ok);
  assert(input.session_id == 12345U);
  ::setenv(sources.session_env.c_str(), "not-a-number", 1);
  assert(seal::resolve_guest_input(sources, now, input).kind == seal::ErrorKind::MalformedInput);

  ::unsetenv(sources.score_env.c_str());
  ::unsetenv(sources.session_env.c_str());
}

}  // namespace

int main() {
  test_sha256_known_answer();
  test_guest_codec_layout();
  test_submission_codec_layout();
  test_utf8_lossy();
  test_binding_known_vectors();
  test_binding_avalanche();
  test_guest_validation_order();
  test_guest_binding_slots();
  test_proof_fields();
  test_proof_verification_detects_tampering();
  test_proof_serialization();
  test_submission_guest_slots();
  test_store_ranks();
  test_store_order_is_permutation_independent();
  test_store_collision();
  test_store_ties_use_full_timestamp_range();
  test_store_lock_contention();
  test_store_global_and_stats();
  test_store_concurrent_inserts();
  test_manager_scenario();
  test_manager_validation();
  test_manager_collision_and_options();
  test_input_sources();

  std::cout << "score_seal_unit_tests passed\n";
  return 0;
}
