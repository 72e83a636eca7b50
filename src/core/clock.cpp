#include "ctxmcp/core/clock.h"

#include <charconv>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace ctxmcp::core {

namespace {

// 9999-12-31T23:59:59Z; later stamps no longer fit the four-digit year.
constexpr std::int64_t kMaxEpochSeconds = 253402300799;

}  // namespace

std::string format_utc_timestamp(const std::chrono::system_clock::time_point t) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(t);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string SystemClock::now_iso8601() const {
  return format_utc_timestamp(std::chrono::system_clock::now());
}

std::string EpochClock::now_iso8601() const {
  return format_utc_timestamp(std::chrono::system_clock::time_point{since_epoch_});
}

std::optional<std::chrono::seconds> parse_source_date_epoch(const std::string& value) {
  std::int64_t secs = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, secs);
  if (value.empty() || ec != std::errc{} || ptr != last || secs < 0 || secs > kMaxEpochSeconds) {
    return std::nullopt;
  }
  return std::chrono::seconds{secs};
}

std::unique_ptr<IClock> make_build_clock(const std::optional<std::string>& source_date_epoch) {
  if (source_date_epoch.has_value()) {
    if (const auto pinned = parse_source_date_epoch(*source_date_epoch)) {
      return std::make_unique<EpochClock>(*pinned);
    }
    std::cerr << "Warning: ignoring invalid SOURCE_DATE_EPOCH: " << *source_date_epoch << "\n";
  }
  return std::make_unique<SystemClock>();
}

}  // namespace ctxmcp::core
