#include "core/proof/proof_builder.hpp"

#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "core/codec/codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace seal {
namespace {

std::string timestamp_le_bytes(std::uint64_t timestamp) {
  std::string out;
  codec::append_le_u64(out, timestamp);
  return out;
}

std::vector<std::uint8_t> public_inputs_for(const ScoreRecord& record) {
  std::string packed;
  packed.reserve(kPublicInputsSize);
  codec::append_le_u32(packed, record.score);
  packed.push_back(static_cast<char>(record.difficulty));
  codec::append_le_u64(packed, record.timestamp);
  return std::vector<std::uint8_t>(packed.begin(), packed.end());
}

Result root_hash_for(const std::string& content_hash, std::uint64_t timestamp, std::string& out) {
  return util::sha256_hex(content_hash + timestamp_le_bytes(timestamp), out);
}

Result proof_path_for(const ScoreRecord& record, std::vector<std::string>& out) {
  std::vector<std::string> path;
  path.reserve(kProofPathLength);
  path.push_back(record.content_hash);

  std::string timestamp_hash;
  Result hashed = util::sha256_hex(timestamp_le_bytes(record.timestamp), timestamp_hash);
  if (!hashed.ok) {
    return hashed;
  }
  path.push_back(std::move(timestamp_hash));

  std::string difficulty_hash;
  const char difficulty_byte = static_cast<char>(record.difficulty);
  hashed = util::sha256_hex(std::string_view{&difficulty_byte, 1}, difficulty_hash);
  if (!hashed.ok) {
    return hashed;
  }
  path.push_back(std::move(difficulty_hash));

  out = std::move(path);
  return Result::success();
}

std::string join_path(const std::vector<std::string>& path) {
  std::string joined;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i != 0) {
      joined.push_back(',');
    }
    joined.append(path[i]);
  }
  return joined;
}

std::vector<std::string> split_path(std::string_view joined) {
  std::vector<std::string> path;
  if (joined.empty()) {
    return path;
  }
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = joined.find(',', start);
    if (comma == std::string_view::npos) {
      path.emplace_back(joined.substr(start));
      break;
    }
    path.emplace_back(joined.substr(start, comma - start));
    start = comma + 1U;
  }
  return path;
}

std::uint32_t read_be_u32(std::string_view bytes) {
  return (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[0])) << 24U) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[1])) << 16U) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[2])) << 8U) |
         static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[3]));
}

}  // namespace

std::string default_session_id(std::uint32_t score) {
  return "session_" + std::to_string(score);
}

Result compute_content_hash(const ScoreRecord& record, std::string& out_hex) {
  std::string payload;
  payload.reserve(record.player_id.size() + record.session_id.size() + 48U);
  payload.append(record.player_id);
  payload.push_back(':');
  payload.append(std::to_string(record.score));
  payload.push_back(':');
  payload.append(std::to_string(record.timestamp));
  payload.push_back(':');
  payload.append(record.session_id);
  payload.push_back(':');
  payload.append(std::to_string(static_cast<unsigned>(record.difficulty)));
  return util::sha256_hex(payload, out_hex);
}

Result build_proof(const ScoreRecord& record, ScoreProof& out) {
  ScoreProof proof;
  proof.score_data = record;

  Result hashed = compute_content_hash(record, proof.score_data.content_hash);
  if (!hashed.ok) {
    return hashed;
  }

  hashed = root_hash_for(proof.score_data.content_hash, record.timestamp, proof.root_hash);
  if (!hashed.ok) {
    return hashed;
  }

  hashed = proof_path_for(proof.score_data, proof.proof_path);
  if (!hashed.ok) {
    return hashed;
  }

  proof.public_inputs = public_inputs_for(proof.score_data);
  out = std::move(proof);
  return Result::success();
}

bool verify_proof(const ScoreProof& proof) {
  std::string expected;
  if (!compute_content_hash(proof.score_data, expected).ok) {
    return false;
  }
  return expected == proof.score_data.content_hash;
}

bool verify_proof_chain(const ScoreProof& proof) {
  if (!verify_proof(proof)) {
    return false;
  }

  std::string root;
  if (!root_hash_for(proof.score_data.content_hash, proof.score_data.timestamp, root).ok ||
      root != proof.root_hash) {
    return false;
  }

  std::vector<std::string> path;
  if (!proof_path_for(proof.score_data, path).ok || path != proof.proof_path) {
    return false;
  }

  return public_inputs_for(proof.score_data) == proof.public_inputs;
}

std::string serialize_proof(const ScoreProof& proof) {
  const ScoreRecord& record = proof.score_data;
  const std::string public_inputs(proof.public_inputs.begin(), proof.public_inputs.end());
  return util::canonical_join({
      {"player_id", record.player_id},
      {"score", std::to_string(record.score)},
      {"timestamp", std::to_string(record.timestamp)},
      {"session_id", record.session_id},
      {"difficulty", std::to_string(static_cast<unsigned>(record.difficulty))},
      {"content_hash", record.content_hash},
      {"root_hash", proof.root_hash},
      {"proof_path", join_path(proof.proof_path)},
      {"public_inputs", util::to_hex(public_inputs)},
  });
}

Result parse_proof(std::string_view payload, ScoreProof& out) {
  const auto fields = util::parse_canonical_map(payload);
  static constexpr std::string_view kRequired[] = {
      "player_id",    "score",     "timestamp",  "session_id",    "difficulty",
      "content_hash", "root_hash", "proof_path", "public_inputs",
  };
  for (std::string_view key : kRequired) {
    if (fields.find(std::string{key}) == fields.end()) {
      return Result::failure(ErrorKind::MalformedInput,
                             "Proof is missing field: " + std::string{key} + ".");
    }
  }

  const std::optional<std::uint64_t> score = util::parse_u64(fields.at("score"));
  const std::optional<std::uint64_t> timestamp = util::parse_u64(fields.at("timestamp"));
  const std::optional<std::uint64_t> difficulty = util::parse_u64(fields.at("difficulty"));
  if (!score || *score > std::numeric_limits<std::uint32_t>::max()) {
    return Result::failure(ErrorKind::MalformedInput, "Proof score is not a u32.");
  }
  if (!timestamp) {
    return Result::failure(ErrorKind::MalformedInput, "Proof timestamp is not a u64.");
  }
  if (!difficulty || *difficulty > std::numeric_limits<std::uint8_t>::max()) {
    return Result::failure(ErrorKind::MalformedInput, "Proof difficulty is not a u8.");
  }

  const std::string& public_hex = fields.at("public_inputs");
  const std::string public_inputs = util::from_hex(public_hex);
  if (public_inputs.empty() && !public_hex.empty()) {
    return Result::failure(ErrorKind::MalformedInput, "Proof public_inputs is not valid hex.");
  }

  ScoreProof proof;
  proof.score_data.player_id = fields.at("player_id");
  proof.score_data.score = static_cast<std::uint32_t>(*score);
  proof.score_data.timestamp = *timestamp;
  proof.score_data.session_id = fields.at("session_id");
  proof.score_data.difficulty = static_cast<std::uint8_t>(*difficulty);
  proof.score_data.content_hash = fields.at("content_hash");
  proof.root_hash = fields.at("root_hash");
  proof.proof_path = split_path(fields.at("proof_path"));
  proof.public_inputs.assign(public_inputs.begin(), public_inputs.end());
  out = std::move(proof);
  return Result::success();
}

Result seal_submission_input(std::string_view bytes, GuestSlots& out_slots, ScoreProof* out_proof) {
  SubmissionInput input;
  Result decoded = codec::decode_submission_input(bytes, input);
  if (!decoded.ok) {
    return decoded;
  }

  ScoreRecord record;
  record.player_id = std::move(input.player_id);
  record.score = input.score;
  record.timestamp = kFixedRecordTimestamp;
  record.session_id = default_session_id(input.score);
  record.difficulty = input.difficulty;

  ScoreProof proof;
  Result built = build_proof(record, proof);
  if (!built.ok) {
    return built;
  }

  const std::string root = util::from_hex(proof.root_hash);
  GuestSlots slots{};
  slots[0] = proof.score_data.score;
  slots[1] = proof.score_data.difficulty;
  slots[2] = static_cast<std::uint32_t>(proof.score_data.timestamp & 0xFFFFFFFFULL);
  slots[3] = static_cast<std::uint32_t>(proof.score_data.timestamp >> 32U);
  for (std::size_t i = 0; i < 4U; ++i) {
    slots[4U + i] = read_be_u32(std::string_view{root}.substr(i * 4U, 4U));
  }

  out_slots = slots;
  if (out_proof != nullptr) {
    *out_proof = std::move(proof);
  }
  return Result::success();
}

}  // namespace seal
