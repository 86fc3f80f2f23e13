#include "time.hpp"

#include <chrono>

namespace mlmeta::util {

namespace {

constexpr std::string_view kLayout = "0000-00-00 00:00:00.000000";

// Epoch nanoseconds are int64: 1677-09-21 00:12:43.145225 .. 2262-04-11 23:47:16.854775.
constexpr auto kMinMicros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::nanoseconds::min());
constexpr auto kMaxMicros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::nanoseconds::max());

bool ReadDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

} // namespace

std::optional<std::int64_t> ParseDocumentTimestamp(std::string_view text) {
  if (text.size() != kLayout.size()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < kLayout.size(); ++i) {
    if (kLayout[i] != '0' && text[i] != kLayout[i]) {
      return std::nullopt;
    }
  }

  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, micros = 0;
  if (!ReadDigits(text, 0, 4, year) || !ReadDigits(text, 5, 2, month) || !ReadDigits(text, 8, 2, day) ||
      !ReadDigits(text, 11, 2, hour) || !ReadDigits(text, 14, 2, minute) || !ReadDigits(text, 17, 2, second) ||
      !ReadDigits(text, 20, 6, micros)) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  const auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second} +
                  std::chrono::microseconds{micros};
  const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
  if (since_epoch < kMinMicros || since_epoch > kMaxMicros) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
}

} // namespace mlmeta::util
