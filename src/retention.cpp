/**
 * @file retention.cpp
 * @brief Retention sweep implementation
 */

#include "cam_merge/retention.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "cam_merge/logging.hpp"
#include "cam_merge/naming.hpp"
#include "cam_merge/types.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

namespace {

constexpr const char *ORIGINAL_PREFIX = "original/";

bool expired(const Ledger &ledger, const std::string &key, double now,
             double window_seconds) {
  auto ts = ledger.timestamp(key);
  return ts && now - *ts > window_seconds;
}

} // anonymous namespace

// **---- Originals ----**

int RetentionEngine::sweep_originals(Ledger &ledger, double now) {
  if (policy_.original_days <= 0) {
    LOG_INFO("Original footage cleanup disabled");
    return 0;
  }

  const double window = policy_.original_days * SECONDS_PER_DAY;
  LOG_PHASE("Checking original footage older than {} days",
            policy_.original_days);

  std::vector<std::string> retire;
  int folders_removed = 0;

  for (const auto &entry : ledger.merge_timestamps) {
    const std::string &text = entry.first;
    if (text.compare(0, 9, ORIGINAL_PREFIX) != 0)
      continue;

    auto key = parse_original_key(text);
    if (!key) {
      LOG_WARN("Dropping malformed original record: {}", text);
      retire.push_back(text);
      continue;
    }
    if (!expired(ledger, text, now, window))
      continue;

    fs::path folder = layout_.original_folder(*key);
    std::error_code ec;
    if (!fs::exists(folder, ec)) {
      retire.push_back(text);
      continue;
    }

    LOG_INFO("Cleaning original folder: {}", folder.string());
    if (clear_original_folder(folder)) {
      ++folders_removed;
      retire.push_back(text);
    }
  }

  for (const auto &text : retire)
    ledger.merge_timestamps.erase(text);
  if (!retire.empty())
    persist(ledger);

  LOG_INFO("Original cleanup done: {} folders removed, {} records retired",
           folders_removed, retire.size());
  return folders_removed;
}

bool RetentionEngine::clear_original_folder(const fs::path &folder) {
  std::error_code ec;
  int deleted = 0;
  bool failures = false;

  std::vector<fs::path> files;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec))
      files.push_back(it->path());
  }
  if (ec) {
    LOG_WARN("Cannot list original folder {}: {}", folder.string(),
             ec.message());
    return false;
  }

  for (const auto &file : files) {
    std::error_code rm_ec;
    if (fs::remove(file, rm_ec)) {
      ++deleted;
    } else if (rm_ec) {
      LOG_WARN("Failed to delete {}: {}", file.string(), rm_ec.message());
      failures = true;
    }
  }

  if (failures) {
    LOG_WARN("Keeping record of {}: some files could not be deleted",
             folder.string());
    return false;
  }

  if (fs::is_empty(folder, ec) && !ec) {
    fs::remove(folder, ec);
    if (ec) {
      LOG_WARN("Failed to remove folder {}: {}", folder.string(), ec.message());
    } else {
      LOG_INFO("Removed original folder {} ({} files)", folder.string(),
               deleted);
    }
  } else {
    LOG_WARN("Folder not empty, left in place: {}", folder.string());
  }
  return true;
}

// **---- Merged ----**

int RetentionEngine::sweep_merged(Ledger &ledger, double now) {
  if (policy_.merged_days <= 0) {
    LOG_INFO("Merged video cleanup disabled");
    return 0;
  }

  const double window = policy_.merged_days * SECONDS_PER_DAY;
  LOG_PHASE("Checking merged videos older than {} days", policy_.merged_days);

  int deleted = 0;
  bool changed = false;

  for (auto it = ledger.hours.begin(); it != ledger.hours.end();) {
    auto key = parse_hour_key(*it);
    if (!key || !expired(ledger, *it, now, window)) {
      ++it;
      continue;
    }
    if (!delete_output(layout_.hour_output(*key))) {
      ++it;
      continue;
    }
    ++deleted;
    ledger.merge_timestamps.erase(*it);
    it = ledger.hours.erase(it);
    changed = true;
  }

  for (auto it = ledger.days.begin(); it != ledger.days.end();) {
    auto key = parse_day_key(*it);
    if (!key || !expired(ledger, *it, now, window)) {
      ++it;
      continue;
    }
    if (!delete_output(layout_.day_output(*key))) {
      ++it;
      continue;
    }
    ++deleted;
    ledger.merge_timestamps.erase(*it);
    it = ledger.days.erase(it);
    changed = true;
  }

  remove_empty_day_dirs();

  if (changed)
    persist(ledger);

  LOG_INFO("Merged cleanup done: {} outputs retired", deleted);
  return deleted;
}

bool RetentionEngine::delete_output(const fs::path &output) {
  std::error_code ec;
  if (fs::remove(output, ec)) {
    LOG_INFO("Deleted expired video: {}", output.string());
    return true;
  }
  if (ec) {
    LOG_WARN("Failed to delete expired video {}: {}", output.string(),
             ec.message());
    return false;
  }
  return true;
}

void RetentionEngine::remove_empty_day_dirs() {
  std::error_code ec;
  std::vector<fs::path> empty_dirs;
  for (fs::directory_iterator it(layout_.merged_root(), ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code dir_ec;
    if (it->is_directory(dir_ec) && fs::is_empty(it->path(), dir_ec) &&
        !dir_ec) {
      empty_dirs.push_back(it->path());
    }
  }

  for (const auto &dir : empty_dirs) {
    std::error_code rm_ec;
    if (fs::remove(dir, rm_ec))
      LOG_INFO("Removed empty day directory: {}", dir.string());
    else if (rm_ec)
      LOG_WARN("Failed to remove {}: {}", dir.string(), rm_ec.message());
  }
}

void RetentionEngine::persist(const Ledger &ledger) {
  if (store_ && !store_->save(ledger))
    LOG_WARN("Retention changes kept in memory only until the next save");
}

} // namespace cam_merge
