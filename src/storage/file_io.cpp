/*
 * CrowdScan - File Helpers
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/storage/file_io.h"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace crowdscan {
namespace storage {

bool file_exists(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return in.good();
}

bool read_text_file(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return false;
  *out = ss.str();
  return true;
}

bool replace_text_file(const std::string& path, const std::string& content) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) == 0) return true;
  // FAT on SD does not replace an existing target
  std::remove(path.c_str());
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool remove_file(const std::string& path) {
  if (!file_exists(path)) return true;
  return std::remove(path.c_str()) == 0;
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

size_t json_capacity_for(size_t text_len) {
  // Every token needs a slot (16-32 bytes) and strings are copied; short
  // numbers make the slot overhead dominate.
  return text_len * 4 + 1024;
}

size_t json_capacity_for(size_t text_len, size_t budget) {
  size_t capacity = json_capacity_for(text_len);
  if (budget > 0 && capacity > budget) return budget;
  return capacity;
}

} // namespace storage
} // namespace crowdscan
