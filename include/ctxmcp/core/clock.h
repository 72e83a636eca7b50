#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace ctxmcp::core {

// Source of the created_at stamp written into a cache manifest.
// Stamps are UTC, second precision, "YYYY-MM-DDTHH:MM:SSZ".
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::string now_iso8601() const = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Formats t as "YYYY-MM-DDTHH:MM:SSZ"; sub-second precision is truncated.
[[nodiscard]] std::string format_utc_timestamp(std::chrono::system_clock::time_point t);

class SystemClock final : public IClock {
 public:
  [[nodiscard]] std::string now_iso8601() const override;
};

// Pinned to a point in time, so rebuilding the same sources yields the same
// manifest bytes.
class EpochClock final : public IClock {
 public:
  explicit EpochClock(std::chrono::seconds since_epoch) : since_epoch_(since_epoch) {}

  [[nodiscard]] std::string now_iso8601() const override;

 private:
  std::chrono::seconds since_epoch_;
};

// Returns a preformatted stamp verbatim (tests).
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  [[nodiscard]] std::string now_iso8601() const override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

// Parses a SOURCE_DATE_EPOCH value: a non-negative decimal count of seconds no
// later than 9999-12-31T23:59:59Z.
[[nodiscard]] std::optional<std::chrono::seconds> parse_source_date_epoch(const std::string& value);

// Clock for cache builds: an EpochClock when source_date_epoch parses,
// otherwise a SystemClock. An unparsable value is reported on stderr.
[[nodiscard]] std::unique_ptr<IClock> make_build_clock(
    const std::optional<std::string>& source_date_epoch);

}  // namespace ctxmcp::core
