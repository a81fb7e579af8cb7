/*
 * CrowdScan - File Helpers
 *
 * Whole-file read/replace used by the payload cache and the JSON settings
 * store. On ESP32 paths point into the SD card VFS mount (/sd/...).
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_FILE_IO_H
#define CROWDSCAN_FILE_IO_H

#include <stddef.h>
#include <string>

namespace crowdscan {
namespace storage {

bool file_exists(const std::string& path);

// Returns false if the file cannot be opened.
bool read_text_file(const std::string& path, std::string* out);

// Writes to "<path>.tmp" and renames over path, so readers never see a
// half-written file.
bool replace_text_file(const std::string& path, const std::string& content);

bool remove_file(const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);

// ArduinoJson document capacity for parsing text_len bytes of JSON,
// including copied strings.
size_t json_capacity_for(size_t text_len);

// As above, capped at budget bytes. A budget of 0 leaves it uncapped.
size_t json_capacity_for(size_t text_len, size_t budget);

} // namespace storage
} // namespace crowdscan

#endif // CROWDSCAN_FILE_IO_H
