#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <ranges>

namespace seal::util {
namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
  return (c & 0xC0U) == 0x80U;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string utf8_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80U) {
      out.push_back(static_cast<char>(lead));
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned char second_lo = 0x80U;
    unsigned char second_hi = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
      length = 2;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      length = 3;
      if (lead == 0xE0U) {
        second_lo = 0xA0U;
      } else if (lead == 0xEDU) {
        second_hi = 0x9FU;
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      length = 4;
      if (lead == 0xF0U) {
        second_lo = 0x90U;
      } else if (lead == 0xF4U) {
        second_hi = 0x8FU;
      }
    } else {
      out.append(kReplacementChar);
      ++i;
      continue;
    }

    std::size_t consumed = 1;
    bool valid = true;
    while (consumed < length) {
      if (i + consumed >= bytes.size()) {
        valid = false;
        break;
      }
      const auto c = static_cast<unsigned char>(bytes[i + consumed]);
      const bool in_range = consumed == 1 ? (c >= second_lo && c <= second_hi) : is_continuation(c);
      if (!in_range) {
        valid = false;
        break;
      }
      ++consumed;
    }

    if (valid) {
      out.append(bytes.substr(i, length));
    } else {
      out.append(kReplacementChar);
    }
    i += consumed;
  }

  return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const char* begin = trimmed.data();
  const char* end = begin + trimmed.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  std::string key;
  std::string value;
  key.reserve(64);
  value.reserve(payload.size());

  bool reading_key = true;
  bool escaping = false;
  for (char c : payload) {
    if (reading_key) {
      if (c == '=') {
        reading_key = false;
        continue;
      }
      if (c == '\n') {
        key.clear();
        continue;
      }
      key.push_back(c);
      continue;
    }

    if (escaping) {
      if (c == 'n') {
        value.push_back('\n');
      } else {
        value.push_back(c);
      }
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (c == '\n') {
      if (!key.empty()) {
        parsed.emplace(key, value);
      }
      key.clear();
      value.clear();
      reading_key = true;
      continue;
    }

    value.push_back(c);
  }

  if (!reading_key && !key.empty()) {
    parsed.emplace(key, value);
  }

  return parsed;
}

}  // namespace seal::util
