#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/proof/proof_builder.hpp"
#include "core/service/score_manager.hpp"
#include "core/util/canonical.hpp"

namespace {

struct HostSession {
  seal::LeaderboardStore store;
  seal::ScoreManager manager{store};
  std::optional<seal::ScoreProof> last_proof;
};

std::vector<std::string> split_words(const std::string& line) {
  std::istringstream in(line);
  std::vector<std::string> words;
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

void print_entries(const std::vector<seal::LeaderboardEntry>& entries) {
  std::size_t rank = 1;
  for (const auto& entry : entries) {
    std::cout << "  #" << rank++ << ' ' << entry.player_id << " score=" << entry.score
              << " difficulty=" << static_cast<unsigned>(entry.difficulty)
              << " timestamp=" << entry.timestamp << " hash=" << entry.content_hash << '\n';
  }
  if (entries.empty()) {
    std::cout << "  (empty)\n";
  }
}

bool run_submit(HostSession& session, const std::vector<std::string>& words) {
  if (words.size() < 4 || words.size() > 6) {
    return false;
  }
  const std::optional<std::uint64_t> score = seal::util::parse_u64(words[2]);
  const std::optional<std::uint64_t> difficulty = seal::util::parse_u64(words[3]);
  if (!score || *score > std::numeric_limits<std::uint32_t>::max() || !difficulty ||
      *difficulty > std::numeric_limits<std::uint8_t>::max()) {
    return false;
  }

  seal::ScoreSubmission submission{
      .player_id = words[1],
      .score = static_cast<std::uint32_t>(*score),
      .difficulty = static_cast<std::uint8_t>(*difficulty),
  };
  if (words.size() >= 5) {
    submission.options.session_id = words[4];
  }
  if (words.size() == 6) {
    const std::optional<std::uint64_t> timestamp = seal::util::parse_u64(words[5]);
    if (!timestamp) {
      return false;
    }
    submission.options.timestamp = *timestamp;
  }

  const seal::ScoreResponse response = session.manager.submit(submission);
  if (!response.success) {
    std::cout << "rejected [" << seal::error_kind_name(response.error_kind)
              << "]: " << response.error << '\n';
    return true;
  }

  std::cout << "accepted rank=" << *response.leaderboard_position
            << " content_hash=" << response.proof->score_data.content_hash
            << " root_hash=" << response.proof->root_hash << '\n';
  session.last_proof = response.proof;
  return true;
}

bool run_save(const HostSession& session, const std::vector<std::string>& words) {
  if (words.size() != 2) {
    return false;
  }
  if (!session.last_proof) {
    std::cout << "no proof to save\n";
    return true;
  }
  std::ofstream out(words[1], std::ios::trunc);
  out << seal::serialize_proof(*session.last_proof);
  if (!out) {
    std::cerr << "Unable to write " << words[1] << '\n';
    return true;
  }
  std::cout << "saved " << words[1] << '\n';
  return true;
}

bool run_verify(const HostSession& session, const std::vector<std::string>& words) {
  if (words.size() != 2) {
    return false;
  }
  std::ifstream in(words[1]);
  if (!in) {
    std::cerr << "Unable to read " << words[1] << '\n';
    return true;
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  seal::ScoreProof proof;
  const seal::Result parsed = seal::parse_proof(contents.str(), proof);
  if (!parsed.ok) {
    std::cout << "invalid proof [" << seal::error_kind_name(parsed.kind) << "]: " << parsed.message
              << '\n';
    return true;
  }
  std::cout << "content_hash " << (session.manager.verify(proof) ? "valid" : "INVALID")
            << ", chain " << (seal::verify_proof_chain(proof) ? "valid" : "INVALID") << '\n';
  return true;
}

bool run_command(HostSession& session, const std::vector<std::string>& words) {
  const std::string& command = words.front();
  if (command == "submit") {
    return run_submit(session, words);
  }
  if (command == "save") {
    return run_save(session, words);
  }
  if (command == "verify") {
    return run_verify(session, words);
  }
  if (command == "board" && words.size() == 3) {
    const std::optional<std::uint64_t> difficulty = seal::util::parse_u64(words[1]);
    const std::optional<std::uint64_t> limit = seal::util::parse_u64(words[2]);
    if (!difficulty || *difficulty > std::numeric_limits<std::uint8_t>::max() || !limit) {
      return false;
    }
    print_entries(session.manager.leaderboard(static_cast<std::uint8_t>(*difficulty),
                                              static_cast<std::size_t>(*limit)));
    return true;
  }
  if (command == "global" && words.size() == 2) {
    const std::optional<std::uint64_t> limit = seal::util::parse_u64(words[1]);
    if (!limit) {
      return false;
    }
    print_entries(session.manager.global_leaderboard(static_cast<std::size_t>(*limit)));
    return true;
  }
  if (command == "stats" && words.size() == 2) {
    const seal::PlayerStats stats = session.manager.player_stats(words[1]);
    std::cout << stats.player_id << " games=" << stats.total_games
              << " highest=" << stats.highest_score << " average=" << stats.average_score << '\n';
    for (const auto& [difficulty, breakdown] : stats.difficulty_breakdown) {
      std::cout << "  difficulty " << static_cast<unsigned>(difficulty)
                << ": games=" << breakdown.games_played << " highest=" << breakdown.highest_score
                << " average=" << breakdown.average_score << '\n';
    }
    return true;
  }
  return false;
}

}  // namespace

int main() {
  std::cout << seal::kAppDisplayName << " host " << seal::kAppVersion << " ("
            << seal::kBuildRelease << ")\n";

  HostSession session;
  std::string line;
  int exit_code = 0;
  while (std::getline(std::cin, line)) {
    const std::vector<std::string> words = split_words(line);
    if (words.empty() || words.front().front() == '#') {
      continue;
    }
    if (!run_command(session, words)) {
      std::cerr << "Malformed command: " << line << '\n';
      exit_code = 1;
    }
  }
  return exit_code;
}
