#include "vdev/common/byte_size.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "vdev/common/diagnostic.hpp"

namespace vdev::common {

namespace {

constexpr std::array<char, 6> kUnitLetters = {'B', 'K', 'M', 'G', 'T', 'P'};

// Multiplier for a unit suffix, 0 if the suffix is not recognized.
auto UnitMultiplier(std::string_view suffix) -> uint64_t {
  if (suffix.empty()) {
    return 1;
  }
  auto upper = [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  };

  char letter = upper(suffix[0]);
  std::string_view rest = suffix.substr(1);
  if (letter == 'B') {
    return rest.empty() ? 1 : 0;
  }

  uint64_t multiplier = 1;
  bool found = false;
  for (size_t i = 1; i < kUnitLetters.size(); ++i) {
    multiplier *= 1024;
    if (kUnitLetters[i] == letter) {
      found = true;
      break;
    }
  }
  if (!found) {
    return 0;
  }

  // K, KB, KiB
  if (rest.empty()) {
    return multiplier;
  }
  if (rest.size() == 1 && upper(rest[0]) == 'B') {
    return multiplier;
  }
  if (rest.size() == 2 && upper(rest[0]) == 'I' && upper(rest[1]) == 'B') {
    return multiplier;
  }
  return 0;
}

}  // namespace

auto ParseByteSize(std::string_view text) -> Result<uint64_t> {
  auto invalid = [&](std::string_view why) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec(
            fmt::format("invalid size '{}': {}", text, why)));
  };

  auto first = text.find_first_not_of(" \t");
  auto last = text.find_last_not_of(" \t");
  if (first == std::string_view::npos) {
    return invalid("empty");
  }
  std::string_view trimmed = text.substr(first, last - first + 1);

  size_t pos = 0;
  while (pos < trimmed.size() &&
         std::isdigit(static_cast<unsigned char>(trimmed[pos])) != 0) {
    ++pos;
  }
  if (pos == 0) {
    return invalid("expected a number");
  }

  uint64_t whole = 0;
  auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + pos, whole);
  if (ec != std::errc{}) {
    return invalid("number out of range");
  }

  // Optional fraction, at most 9 significant digits kept
  uint64_t frac_num = 0;
  uint64_t frac_den = 1;
  if (pos < trimmed.size() && trimmed[pos] == '.') {
    ++pos;
    size_t frac_start = pos;
    while (pos < trimmed.size() &&
           std::isdigit(static_cast<unsigned char>(trimmed[pos])) != 0) {
      if (frac_den < 1'000'000'000) {
        frac_num = frac_num * 10 + static_cast<uint64_t>(trimmed[pos] - '0');
        frac_den *= 10;
      }
      ++pos;
    }
    if (pos == frac_start) {
      return invalid("expected digits after '.'");
    }
  }

  uint64_t multiplier = UnitMultiplier(trimmed.substr(pos));
  if (multiplier == 0) {
    return invalid(
        fmt::format("unknown unit '{}', use B, K, M, G, T or P",
                    trimmed.substr(pos)));
  }

  if (whole > std::numeric_limits<uint64_t>::max() / multiplier) {
    return invalid("size overflows 64 bits");
  }
  uint64_t bytes = whole * multiplier;

  if (frac_num != 0) {
    auto frac_bytes = static_cast<uint64_t>(
        static_cast<long double>(frac_num) /
        static_cast<long double>(frac_den) *
        static_cast<long double>(multiplier));
    if (bytes > std::numeric_limits<uint64_t>::max() - frac_bytes) {
      return invalid("size overflows 64 bits");
    }
    bytes += frac_bytes;
  }

  return bytes;
}

auto FormatByteSize(uint64_t bytes) -> std::string {
  if (bytes < 1024) {
    return fmt::format("{}B", bytes);
  }

  size_t unit = 0;
  uint64_t divisor = 1;
  while (unit + 1 < kUnitLetters.size() && bytes / divisor >= 1024) {
    divisor *= 1024;
    ++unit;
  }

  if (bytes % divisor == 0) {
    return fmt::format("{}{}", bytes / divisor, kUnitLetters[unit]);
  }
  return fmt::format(
      "{:.1f}{}",
      static_cast<double>(bytes) / static_cast<double>(divisor),
      kUnitLetters[unit]);
}

}  // namespace vdev::common
