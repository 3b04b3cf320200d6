#include "mr/ai/cost_rate.hpp"

#include <cctype>
#include <cmath>
#include <string>

namespace mr::ai {

namespace {
constexpr std::int64_t kMicroPerUsd = 1'000'000;
constexpr auto kMaxWholeUsd = static_cast<std::int64_t>(kMaxUsdPerMillion);

std::string_view trim(std::string_view view) {
  std::size_t start = 0;
  std::size_t end = view.size();
  while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
    ++start;
  while (end > start &&
         std::isspace(static_cast<unsigned char>(view[end - 1])))
    --end;
  return view.substr(start, end - start);
}

std::string lower(std::string_view view) {
  std::string out;
  out.reserve(view.size());
  for (char ch : view)
    out.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  return out;
}

// Parses "<digits>[.<digits>]" into micro-dollars, rounding half up at the
// seventh fractional digit. Sets consumed to the number of characters read.
std::optional<std::int64_t> parse_decimal(std::string_view text,
                                          std::size_t &consumed) {
  std::size_t pos = 0;
  std::int64_t whole = 0;
  bool any_digit = false;
  while (pos < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos]))) {
    whole = whole * 10 + (text[pos] - '0');
    if (whole > kMaxWholeUsd)
      return std::nullopt;
    any_digit = true;
    ++pos;
  }

  std::int64_t fraction = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    bool round_up = false;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6)
        fraction = fraction * 10 + (text[pos] - '0');
      else if (digits == 6)
        round_up = text[pos] >= '5';
      ++digits;
      any_digit = true;
      ++pos;
    }
    for (int i = digits; i < 6; ++i)
      fraction *= 10;
    if (round_up)
      ++fraction;
  }

  if (!any_digit)
    return std::nullopt;
  consumed = pos;
  return whole * kMicroPerUsd + fraction;
}

// Returns the multiplier that scales a per-unit price to a per-million price.
std::optional<std::int64_t> parse_unit_suffix(std::string_view suffix) {
  std::string text = lower(trim(suffix));
  if (text.empty())
    return 1;

  if (text.rfind("per ", 0) == 0)
    text = std::string(trim(std::string_view(text).substr(4)));
  else if (text.front() == '/')
    text = std::string(trim(std::string_view(text).substr(1)));
  else
    return std::nullopt;

  const std::string tokens_word = "tokens";
  if (text.size() >= tokens_word.size() &&
      text.compare(text.size() - tokens_word.size(), tokens_word.size(),
                   tokens_word) == 0)
    text = std::string(
        trim(std::string_view(text).substr(0, text.size() - tokens_word.size())));

  if (text == "1m" || text == "m")
    return 1;
  if (text == "1k" || text == "k")
    return 1000;
  return std::nullopt;
}
} // namespace

CostRate CostRate::from_usd(double usd_per_million) {
  return CostRate{static_cast<std::int64_t>(
      std::llround(usd_per_million * static_cast<double>(kMicroPerUsd)))};
}

double CostRate::usd_per_million() const noexcept {
  return static_cast<double>(micro_usd_per_million) /
         static_cast<double>(kMicroPerUsd);
}

std::optional<CostRate> parse_cost_rate(std::string_view text) {
  std::string_view rest = trim(text);
  if (!rest.empty() && rest.front() == '$')
    rest = trim(rest.substr(1));
  if (rest.empty() || rest.front() == '-' || rest.front() == '+')
    return std::nullopt;

  std::size_t consumed = 0;
  auto micro = parse_decimal(rest, consumed);
  if (!micro)
    return std::nullopt;

  auto multiplier = parse_unit_suffix(rest.substr(consumed));
  if (!multiplier)
    return std::nullopt;
  if (*micro > INT64_MAX / *multiplier)
    return std::nullopt;

  return CostRate{*micro * *multiplier};
}

std::string format_cost_rate(CostRate rate) {
  const std::int64_t micro = rate.micro_usd_per_million;
  const std::string sign = micro < 0 ? "-" : "";
  // Negated in unsigned arithmetic so INT64_MIN has a magnitude too.
  const std::uint64_t magnitude =
      micro < 0 ? 0 - static_cast<std::uint64_t>(micro)
                : static_cast<std::uint64_t>(micro);
  const auto per_usd = static_cast<std::uint64_t>(kMicroPerUsd);

  std::string fraction = std::to_string(magnitude % per_usd);
  fraction.insert(0, 6 - fraction.size(), '0');
  while (fraction.size() > 2 && fraction.back() == '0')
    fraction.pop_back();

  return sign + "$" + std::to_string(magnitude / per_usd) + "." + fraction +
         "/1M tokens";
}

} // namespace mr::ai
