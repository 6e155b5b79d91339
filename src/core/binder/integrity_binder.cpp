#include "core/binder/integrity_binder.hpp"

#include <string>

#include "core/codec/codec.hpp"

namespace seal {
namespace {

constexpr std::uint64_t kMixMultiplierA = 0xff51afd7ed558ccdULL;
constexpr std::uint64_t kMixMultiplierB = 0xc4ceb9fe1a85ec53ULL;
constexpr std::uint64_t kFinalCheckModulus = 0xFFFFFFFFULL;

std::uint64_t rotl64(std::uint64_t x, unsigned n) {
  return (x << n) | (x >> (64U - n));
}

std::uint32_t low32(std::uint64_t x) {
  return static_cast<std::uint32_t>(x & 0xFFFFFFFFULL);
}

std::uint32_t high32(std::uint64_t x) {
  return static_cast<std::uint32_t>(x >> 32U);
}

}  // namespace

const char* guest_violation_name(GuestViolation violation) {
  switch (violation) {
    case GuestViolation::None:
      return "None";
    case GuestViolation::ScoreOutOfRange:
      return "ScoreOutOfRange";
    case GuestViolation::SessionIdZero:
      return "SessionIdZero";
    case GuestViolation::SessionBeforeEpoch:
      return "SessionBeforeEpoch";
  }
  return "Unknown";
}

GuestViolation first_guest_violation(std::uint64_t score, std::uint64_t session_id) {
  if (score < kGuestMinScore || score > kGuestMaxScore) {
    return GuestViolation::ScoreOutOfRange;
  }
  if (session_id == 0) {
    return GuestViolation::SessionIdZero;
  }
  if ((session_id >> kSessionTimestampShift) < kMinSessionEpoch) {
    return GuestViolation::SessionBeforeEpoch;
  }
  return GuestViolation::None;
}

Result validate_guest_fields(std::uint64_t score, std::uint64_t session_id) {
  switch (first_guest_violation(score, session_id)) {
    case GuestViolation::None:
      return Result::success();
    case GuestViolation::ScoreOutOfRange:
      return Result::failure(ErrorKind::ValidationError,
                             "Invalid score: " + std::to_string(score) + " (must be 1-1000).");
    case GuestViolation::SessionIdZero:
      return Result::failure(ErrorKind::ValidationError, "Invalid game session id: 0.");
    case GuestViolation::SessionBeforeEpoch:
      return Result::failure(ErrorKind::ValidationError,
                             "Game session timestamp predates protocol launch: " +
                                 std::to_string(session_id >> kSessionTimestampShift) + ".");
  }
  return Result::failure(ErrorKind::ValidationError, "Unknown guest violation.");
}

std::uint32_t proof_binding(std::uint64_t score, std::uint64_t session_id) {
  std::uint64_t combined = score ^ rotl64(session_id, 32U);

  combined ^= combined >> 33U;
  combined *= kMixMultiplierA;
  combined ^= combined >> 33U;
  combined *= kMixMultiplierB;
  combined ^= combined >> 33U;

  return low32(combined) ^ high32(combined);
}

std::uint64_t verification_mix(std::uint64_t score, std::uint64_t session_id) {
  return (score ^ session_id) + score * 31337ULL + session_id * 1337ULL;
}

std::uint32_t final_check(std::uint32_t binding, std::uint64_t mix) {
  const std::uint64_t sum = static_cast<std::uint64_t>(binding) + low32(mix);
  return static_cast<std::uint32_t>(sum % kFinalCheckModulus);
}

Result bind_guest_input(std::string_view bytes, BindingOutput& out) {
  GuestInput input;
  Result decoded = codec::decode_guest_input(bytes, input);
  if (!decoded.ok) {
    return decoded;
  }

  Result valid = validate_guest_fields(input.score, input.session_id);
  if (!valid.ok) {
    return valid;
  }

  BindingOutput output;
  output.score = input.score;
  output.session_id = input.session_id;
  output.binding = proof_binding(input.score, input.session_id);
  output.verification_mix = verification_mix(input.score, input.session_id);
  output.final_check = final_check(output.binding, output.verification_mix);
  out = output;
  return Result::success();
}

GuestSlots guest_output_slots(const BindingOutput& output, bool extended) {
  GuestSlots slots{};
  slots[0] = low32(output.score);
  slots[1] = high32(output.score);
  slots[2] = low32(output.session_id);
  slots[3] = high32(output.session_id);
  slots[4] = output.binding;
  if (extended) {
    slots[5] = low32(output.verification_mix);
    slots[6] = high32(output.verification_mix);
    slots[7] = output.final_check;
  }
  return slots;
}

}  // namespace seal
