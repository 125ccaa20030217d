/**
 * @file naming.cpp
 * @brief Folder-name parsing and ledger key codec implementation
 */

#include "cam_merge/naming.hpp"

#include <vector>

#include <fmt/core.h>

namespace cam_merge {

namespace {

constexpr std::string_view ORIGINAL_PREFIX = "original/";

bool all_digits(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
  }
  return true;
}

int to_int(std::string_view s) {
  int v = 0;
  for (char c : s)
    v = v * 10 + (c - '0');
  return v;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

/// Well-formed UTF-8: no stray continuation bytes, overlongs or surrogates
bool valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    unsigned cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > s.size())
      return false;
    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    static const unsigned min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_cp[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

/// A directory-name segment usable inside a key
bool valid_segment(std::string_view s) {
  return !s.empty() && s != "." && s != ".." &&
         s.find('/') == std::string_view::npos &&
         s.find('\0') == std::string_view::npos && valid_utf8(s);
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (true) {
    size_t end = s.find(sep, pos);
    if (end == std::string_view::npos) {
      parts.push_back(s.substr(pos));
      break;
    }
    parts.push_back(s.substr(pos, end - pos));
    pos = end + 1;
  }
  return parts;
}

} // anonymous namespace

bool is_key_segment(std::string_view name) { return valid_segment(name); }

// **----- FOLDER DATES -----**

std::optional<BucketTime> parse_folder_date(std::string_view name) {
  if ((name.size() != 8 && name.size() != 10) || !all_digits(name))
    return std::nullopt;

  BucketTime t;
  t.year = to_int(name.substr(0, 4));
  t.month = to_int(name.substr(4, 2));
  t.day = to_int(name.substr(6, 2));

  if (t.year < 1970 || t.month < 1 || t.month > 12)
    return std::nullopt;
  if (t.day < 1 || t.day > days_in_month(t.year, t.month))
    return std::nullopt;

  if (name.size() == 10) {
    int hour = to_int(name.substr(8, 2));
    if (hour > 23)
      return std::nullopt;
    t.hour = hour;
  }
  return t;
}

bool is_hour_folder(std::string_view name) {
  auto t = parse_folder_date(name);
  return t && t->hour.has_value();
}

bool is_day_name(std::string_view name) {
  auto t = parse_folder_date(name);
  return t && !t->hour.has_value();
}

// **----- LEDGER KEYS -----**

std::optional<HourKey> make_hour_key(const std::string &location,
                                     const std::string &camera_id,
                                     const std::string &hour_folder) {
  if (!valid_segment(location) || !valid_segment(camera_id) ||
      !is_hour_folder(hour_folder)) {
    return std::nullopt;
  }
  return HourKey{location, camera_id, hour_folder.substr(0, 8),
                 hour_folder.substr(8, 2)};
}

std::string to_string(const HourKey &key) {
  return fmt::format("{}/{}/{}{}", key.location, key.camera_id, key.day,
                     key.hour);
}

std::string to_string(const DayKey &key) {
  return fmt::format("{}_{}", key.location, key.day);
}

std::string to_string(const OriginalFolderKey &key) {
  return fmt::format("{}{}/{}/{}", ORIGINAL_PREFIX, key.location,
                     key.camera_id, key.folder);
}

std::string to_string(const LedgerKey &key) {
  return std::visit([](const auto &k) { return to_string(k); }, key);
}

std::optional<HourKey> parse_hour_key(std::string_view text) {
  if (text.compare(0, ORIGINAL_PREFIX.size(), ORIGINAL_PREFIX) == 0)
    return std::nullopt;

  auto parts = split(text, '/');
  if (parts.size() != 3)
    return std::nullopt;
  return make_hour_key(std::string(parts[0]), std::string(parts[1]),
                       std::string(parts[2]));
}

std::optional<DayKey> parse_day_key(std::string_view text) {
  if (text.find('/') != std::string_view::npos)
    return std::nullopt;

  size_t sep = text.rfind('_');
  if (sep == std::string_view::npos || sep == 0)
    return std::nullopt;

  std::string_view location = text.substr(0, sep);
  std::string_view day = text.substr(sep + 1);
  if (!valid_segment(location) || !is_day_name(day))
    return std::nullopt;
  return DayKey{std::string(location), std::string(day)};
}

std::optional<OriginalFolderKey> parse_original_key(std::string_view text) {
  if (text.compare(0, ORIGINAL_PREFIX.size(), ORIGINAL_PREFIX) != 0)
    return std::nullopt;

  auto parts = split(text.substr(ORIGINAL_PREFIX.size()), '/');
  if (parts.size() != 3 || !valid_segment(parts[0]) ||
      !valid_segment(parts[1]) || !is_hour_folder(parts[2])) {
    return std::nullopt;
  }
  return OriginalFolderKey{std::string(parts[0]), std::string(parts[1]),
                           std::string(parts[2])};
}

std::optional<LedgerKey> parse_ledger_key(std::string_view text) {
  if (auto k = parse_original_key(text))
    return LedgerKey{*k};
  if (auto k = parse_hour_key(text))
    return LedgerKey{*k};
  if (auto k = parse_day_key(text))
    return LedgerKey{*k};
  return std::nullopt;
}

// **----- OUTPUT NAMES -----**

std::string hour_output_name(const std::string &day,
                             const std::string &location,
                             const std::string &hour) {
  return fmt::format("{}_{}_{}.mp4", day, location, hour);
}

std::string day_output_name(const std::string &day,
                            const std::string &location) {
  return fmt::format("{}_{}.mp4", day, location);
}

} // namespace cam_merge
