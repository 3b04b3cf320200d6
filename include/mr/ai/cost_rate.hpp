#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mr::ai {

// Price of one million tokens, in millionths of a US dollar. Kept as an
// integer so ceilings compare exactly.
struct CostRate {
  std::int64_t micro_usd_per_million = 0;

  static CostRate from_usd(double usd_per_million);
  double usd_per_million() const noexcept;

  bool operator==(const CostRate &other) const noexcept {
    return micro_usd_per_million == other.micro_usd_per_million;
  }
  bool operator!=(const CostRate &other) const noexcept {
    return !(*this == other);
  }
  bool operator<(const CostRate &other) const noexcept {
    return micro_usd_per_million < other.micro_usd_per_million;
  }
  bool operator<=(const CostRate &other) const noexcept {
    return micro_usd_per_million <= other.micro_usd_per_million;
  }
};

// Largest magnitude from_usd() converts without overflowing the micro-dollar
// count; matches the whole-dollar limit parse_cost_rate() accepts.
inline constexpr double kMaxUsdPerMillion = 9'000'000'000'000.0;

// Accepts display strings such as "$0.14", "$1/1M tokens", "2.50 / 1M" or
// "$0.40/1K tokens". Returns std::nullopt for negative or malformed input.
std::optional<CostRate> parse_cost_rate(std::string_view text);

// "$0.14/1M tokens"; at least two decimals, trailing zeros beyond that are
// dropped.
std::string format_cost_rate(CostRate rate);

} // namespace mr::ai
