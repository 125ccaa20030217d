/**
 * @file ledger.cpp
 * @brief Ledger JSON persistence implementation
 */

#include "cam_merge/ledger.hpp"

#include <stdexcept>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "cam_merge/logging.hpp"

namespace cam_merge {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Insert every string of root[member] into @p out, skipping non-strings
void read_key_array(const json &root, const char *member,
                    std::set<std::string> &out) {
  auto it = root.find(member);
  if (it == root.end() || it->is_null())
    return;
  if (!it->is_array())
    throw std::runtime_error(fmt::format("'{}' is not an array", member));
  for (const auto &item : *it) {
    if (item.is_string())
      out.insert(item.get<std::string>());
    else
      LOG_WARN("Ignoring non-string ledger entry in '{}': {}", member,
               item.dump());
  }
}

} // anonymous namespace

Ledger LedgerStore::load() const {
  Ledger ledger;

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    LOG_INFO("No ledger at {}, starting empty", path_);
    return ledger;
  }

  std::ifstream in(path_);
  if (!in) {
    LOG_ERROR("Cannot open ledger {}, starting empty", path_);
    return ledger;
  }

  try {
    json root = json::parse(in);
    if (!root.is_object())
      throw std::runtime_error("top level is not an object");

    read_key_array(root, "hours", ledger.hours);
    read_key_array(root, "days", ledger.days);

    auto ts = root.find("merge_timestamps");
    if (ts != root.end() && !ts->is_null()) {
      if (!ts->is_object())
        throw std::runtime_error("'merge_timestamps' is not an object");
      for (auto it = ts->begin(); it != ts->end(); ++it) {
        if (it.value().is_number())
          ledger.merge_timestamps[it.key()] = it.value().get<double>();
        else
          LOG_WARN("Ignoring non-numeric timestamp for {}", it.key());
      }
    }
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load ledger {}: {}. Starting empty", path_, e.what());
    return Ledger{};
  }

  LOG_INFO("Loaded ledger: {} hours, {} days, {} timestamps",
           ledger.hours.size(), ledger.days.size(),
           ledger.merge_timestamps.size());
  return ledger;
}

bool LedgerStore::save(const Ledger &ledger) const {
  json root;
  root["hours"] = ledger.hours;
  root["days"] = ledger.days;
  root["merge_timestamps"] = ledger.merge_timestamps;

  /// dump() rejects keys that are not valid UTF-8
  std::string text;
  try {
    text = root.dump(2);
  } catch (const json::exception &e) {
    LOG_ERROR("Cannot serialize ledger {}: {}", path_, e.what());
    return false;
  }

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      LOG_ERROR("Cannot write ledger temp file {}", tmp);
      return false;
    }
    out << text;
    out.flush();
    if (!out) {
      LOG_ERROR("Short write to ledger temp file {}", tmp);
      std::error_code ec;
      fs::remove(tmp, ec);
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmp, path_, ec);
  if (ec) {
    LOG_ERROR("Failed to replace ledger {}: {}", path_, ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace cam_merge
