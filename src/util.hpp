#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chordrelay {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// URL-safe identifier: lowercase, runs of non-[a-z0-9] collapse to '-',
// no leading/trailing '-', at most max_len chars. Empty input yields fallback.
std::string slugify(const std::string& text, size_t max_len = 60,
                    const std::string& fallback = "agent");

} // namespace chordrelay
