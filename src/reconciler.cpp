/**
 * @file reconciler.cpp
 * @brief Ledger reconciliation implementation
 */

#include "cam_merge/reconciler.hpp"

#include <algorithm>
#include <filesystem>

#include "cam_merge/logging.hpp"
#include "cam_merge/validity.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

VerifyReport Reconciler::verify(const Ledger &ledger, bool deep) {
  LOG_PHASE("Verifying ledger: {} hours, {} days{}", ledger.hours.size(),
            ledger.days.size(), deep ? " (deep check)" : "");

  VerifyReport report;

  for (const auto &text : ledger.hours) {
    auto key = parse_hour_key(text);
    if (!key) {
      LOG_WARN("Malformed hour record: {}", text);
      report.invalid_hours.push_back(text);
      continue;
    }

    std::error_code ec;
    fs::path camera = layout_.camera_dir(key->location, key->camera_id);
    if (!fs::is_directory(camera, ec)) {
      LOG_WARN("Camera directory gone for hour record {}: {}", text,
               camera.string());
      report.invalid_hours.push_back(text);
      continue;
    }

    fs::path output = layout_.hour_output(*key);
    if (!is_valid_output(output, min_valid_size_kb_, deep, transcoder_)) {
      LOG_WARN("Hour output missing or invalid: {}", output.string());
      report.invalid_hours.push_back(text);
    }
  }

  for (const auto &text : ledger.days) {
    auto key = parse_day_key(text);
    if (!key) {
      LOG_WARN("Malformed day record: {}", text);
      report.invalid_days.push_back(text);
      continue;
    }

    fs::path output = layout_.day_output(*key);
    if (!is_valid_output(output, min_valid_size_kb_, deep, transcoder_)) {
      LOG_WARN("Day output missing or invalid: {}", output.string());
      report.invalid_days.push_back(text);
    }
  }

  if (report.empty())
    LOG_SUCCESS("Ledger verified, all records valid");
  else
    LOG_WARN("Ledger verification found {} invalid hours, {} invalid days",
             report.invalid_hours.size(), report.invalid_days.size());
  return report;
}

OutputListing Reconciler::valid_outputs(const Ledger &ledger) const {
  OutputListing listing;
  std::error_code ec;

  for (const auto &text : ledger.hours) {
    if (auto key = parse_hour_key(text)) {
      fs::path p = layout_.hour_output(*key);
      if (fs::is_regular_file(p, ec))
        listing.hours.push_back(p.string());
    }
  }
  for (const auto &text : ledger.days) {
    if (auto key = parse_day_key(text)) {
      fs::path p = layout_.day_output(*key);
      if (fs::is_regular_file(p, ec))
        listing.days.push_back(p.string());
    }
  }

  std::sort(listing.hours.begin(), listing.hours.end());
  std::sort(listing.days.begin(), listing.days.end());
  return listing;
}

int clean_records(Ledger &ledger, const VerifyReport &report) {
  int removed = 0;
  for (const auto &key : report.invalid_hours) {
    removed += static_cast<int>(ledger.hours.erase(key));
    ledger.merge_timestamps.erase(key);
  }
  for (const auto &key : report.invalid_days) {
    removed += static_cast<int>(ledger.days.erase(key));
    ledger.merge_timestamps.erase(key);
  }
  if (removed > 0)
    LOG_INFO("Cleaned {} invalid records from the ledger", removed);
  return removed;
}

} // namespace cam_merge
