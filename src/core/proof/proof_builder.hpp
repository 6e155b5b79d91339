#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace seal {

inline constexpr std::size_t kProofPathLength = 3;
inline constexpr std::size_t kPublicInputsSize = 13;

std::string default_session_id(std::uint32_t score);

// SHA-256 hex of "player_id:score:timestamp:session_id:difficulty" with decimal numbers.
Result compute_content_hash(const ScoreRecord& record, std::string& out_hex);

// Fills content_hash, root_hash, proof_path and public_inputs. Any caller-supplied
// content_hash on the record is discarded.
Result build_proof(const ScoreRecord& record, ScoreProof& out);

// True iff content_hash re-derives from the record fields.
[[nodiscard]] bool verify_proof(const ScoreProof& proof);
// Also re-derives root_hash, every proof_path element and public_inputs.
[[nodiscard]] bool verify_proof_chain(const ScoreProof& proof);

std::string serialize_proof(const ScoreProof& proof);
Result parse_proof(std::string_view payload, ScoreProof& out);

// Guest-side submission path: record with the fixed timestamp and default session id,
// exposed as score, difficulty, timestamp lo/hi and the first 16 root-hash bytes (BE words).
Result seal_submission_input(std::string_view bytes, GuestSlots& out_slots, ScoreProof* out_proof);

}  // namespace seal
