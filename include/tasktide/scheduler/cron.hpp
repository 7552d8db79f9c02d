#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"

#include <array>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasktide::scheduler {

/// Five-field crontab expression evaluated in local wall time.
///
/// Each field accepts `*`, `*/n`, a single value, an `a-b` range or a comma list of values
/// and ranges. Fields combine with AND; day-of-week runs 0 (Sunday) to 6.
class CronExpression {
public:
  [[nodiscard]] static common::Result<CronExpression> parse(std::string_view expression);

  /// Smallest whole minute strictly after `after` that satisfies every field, or nullopt when
  /// the expression cannot fire (for example `0 0 31 2 *`).
  [[nodiscard]] std::optional<common::TimePoint> next_occurrence(common::TimePoint after) const;
  [[nodiscard]] bool matches(const std::tm &time) const;

  [[nodiscard]] const std::string &minute() const { return fields_[0]; }
  [[nodiscard]] const std::string &hour() const { return fields_[1]; }
  [[nodiscard]] const std::string &day() const { return fields_[2]; }
  [[nodiscard]] const std::string &month() const { return fields_[3]; }
  [[nodiscard]] const std::string &day_of_week() const { return fields_[4]; }
  [[nodiscard]] std::string to_string() const;

private:
  [[nodiscard]] static common::Result<std::vector<bool>> parse_field(std::string_view field,
                                                                     int min, int max);

  std::array<std::string, 5> fields_;
  std::vector<bool> minutes_;
  std::vector<bool> hours_;
  std::vector<bool> days_;
  std::vector<bool> months_;
  std::vector<bool> weekdays_;
};

} // namespace tasktide::scheduler
