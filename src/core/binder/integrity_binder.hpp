#pragma once

#include <cstdint>
#include <string_view>

#include "core/model/types.hpp"

namespace seal {

inline constexpr std::uint64_t kGuestMinScore = 1;
inline constexpr std::uint64_t kGuestMaxScore = 1000;
inline constexpr unsigned kSessionTimestampShift = 20;
// No session may predate protocol launch.
inline constexpr std::uint64_t kMinSessionEpoch = 1700000000ULL;

enum class GuestViolation {
  None,
  ScoreOutOfRange,
  SessionIdZero,
  SessionBeforeEpoch,
};

const char* guest_violation_name(GuestViolation violation);

// Checks in order: score range, non-zero session id, session epoch. Returns the first failure.
[[nodiscard]] GuestViolation first_guest_violation(std::uint64_t score, std::uint64_t session_id);
Result validate_guest_fields(std::uint64_t score, std::uint64_t session_id);

// 64-bit avalanche finalizer over score and rotated session id, folded to 32 bits.
[[nodiscard]] std::uint32_t proof_binding(std::uint64_t score, std::uint64_t session_id);
[[nodiscard]] std::uint64_t verification_mix(std::uint64_t score, std::uint64_t session_id);
[[nodiscard]] std::uint32_t final_check(std::uint32_t binding, std::uint64_t mix);

// Decode, validate and bind a 16-byte guest buffer. No output is produced on failure.
Result bind_guest_input(std::string_view bytes, BindingOutput& out);

// Slots 0..4 always; 5..7 only when extended, otherwise zero.
[[nodiscard]] GuestSlots guest_output_slots(const BindingOutput& output, bool extended);

}  // namespace seal
