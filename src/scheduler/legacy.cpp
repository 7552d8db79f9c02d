#include "tasktide/scheduler/legacy.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/json_util.hpp"
#include "tasktide/observability/global.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace tasktide::scheduler {

namespace {

constexpr const char *kUnknown = "unknown";

std::string field_or_empty(const common::JsonFlatMap &map, const std::string &key) {
  const auto it = map.find(key);
  if (it == map.end() || it->second == "null") {
    return "";
  }
  return common::trim(it->second);
}

std::string interval_spec(const std::string &raw_seconds) {
  double seconds = 0.0;
  auto [ptr, ec] =
      std::from_chars(raw_seconds.data(), raw_seconds.data() + raw_seconds.size(), seconds);
  if (raw_seconds.empty() || ec != std::errc() || ptr != raw_seconds.data() + raw_seconds.size() ||
      !std::isfinite(seconds)) {
    return kUnknown;
  }
  const auto whole = static_cast<long long>(std::floor(seconds));
  if (whole <= 0) {
    return kUnknown;
  }
  if (whole < 60) {
    return "every " + std::to_string(whole) + "s";
  }
  if (whole < 3600) {
    return "every " + std::to_string(whole / 60) + "m";
  }
  if (whole < 86400) {
    return "every " + std::to_string(whole / 3600) + "h";
  }
  return "every " + std::to_string(whole / 86400) + "d";
}

} // namespace

LegacyMigrator::LegacyMigrator(std::filesystem::path legacy_file)
    : legacy_file_(std::move(legacy_file)) {}

bool LegacyMigrator::pending() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(legacy_file_, ec);
}

std::filesystem::path LegacyMigrator::migrated_file() const {
  return std::filesystem::path(legacy_file_.string() + ".migrated");
}

std::string LegacyMigrator::schedule_type_for(const std::string &trigger_json) {
  const std::string type = field_or_empty(common::json_parse_flat(trigger_json), "type");
  if (type == "cron" || type == "interval" || type == "date") {
    return type;
  }
  return kUnknown;
}

std::string LegacyMigrator::schedule_value_for(const std::string &trigger_json) {
  const auto trigger = common::json_parse_flat(trigger_json);
  const std::string type = field_or_empty(trigger, "type");

  if (type == "cron") {
    static constexpr std::array<const char *, 5> kFields = {"minute", "hour", "day", "month",
                                                            "day_of_week"};
    std::string expression;
    for (const char *field : kFields) {
      const std::string value = field_or_empty(trigger, field);
      if (value.empty()) {
        return kUnknown;
      }
      expression += expression.empty() ? value : " " + value;
    }
    return "cron:" + expression;
  }
  if (type == "interval") {
    return interval_spec(field_or_empty(trigger, "seconds"));
  }
  if (type == "date") {
    const std::string run_date = field_or_empty(trigger, "run_date");
    return run_date.empty() ? std::string(kUnknown) : "at:" + run_date;
  }
  return kUnknown;
}

common::Result<std::vector<Schedule>> LegacyMigrator::read() const {
  using ResultT = common::Result<std::vector<Schedule>>;
  const auto content = common::read_file(legacy_file_);
  if (!content.ok()) {
    return ResultT::failure(content.error());
  }
  if (!common::json_is_object(content.value())) {
    return ResultT::failure("legacy schedule file is not a JSON object: " +
                            legacy_file_.string());
  }

  const auto now = common::Clock::now();
  std::vector<Schedule> rows;
  for (const auto &[task_id, entry_json] : common::json_parse_flat(content.value())) {
    const auto entry = common::json_parse_flat(entry_json);
    const auto trigger_it = entry.find("trigger");
    const std::string trigger_json = trigger_it == entry.end() ? "{}" : trigger_it->second;

    Schedule row;
    row.task_id = task_id;
    row.job_id = field_or_empty(entry, "job_id");
    row.schedule_type = schedule_type_for(trigger_json);
    row.schedule_value = schedule_value_for(trigger_json);
    row.created_at = now;
    if (const std::string next = field_or_empty(entry, "next_run_time"); !next.empty()) {
      if (auto parsed = common::parse_iso8601(next); parsed.ok()) {
        row.next_run_time = parsed.value();
      }
    }
    rows.push_back(std::move(row));
  }
  return ResultT::success(std::move(rows));
}

common::Result<LegacyMigrationReport> LegacyMigrator::migrate(SchedulerStore &store) const {
  using ResultT = common::Result<LegacyMigrationReport>;
  LegacyMigrationReport report;
  if (!pending()) {
    return ResultT::success(report);
  }

  auto rows = read();
  if (!rows.ok()) {
    return ResultT::failure(rows.error());
  }
  report.entries = rows.value().size();
  if (rows.value().empty()) {
    return ResultT::success(report);
  }

  auto imported = store.import_schedules(rows.value());
  if (!imported.ok()) {
    return ResultT::failure(imported.error());
  }
  report.imported = imported.value();

  std::error_code ec;
  std::filesystem::rename(legacy_file_, migrated_file(), ec);
  if (ec) {
    return ResultT::failure("Failed to rename " + legacy_file_.string() + ": " + ec.message());
  }
  report.renamed = true;

  observability::record_info("legacy", "Migrated " + std::to_string(report.imported) + " of " +
                                           std::to_string(report.entries) +
                                           " legacy schedules from " + legacy_file_.string());
  return ResultT::success(report);
}

} // namespace tasktide::scheduler
