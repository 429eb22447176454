#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tile_link::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
// Local time with microseconds, safe for file names: 20240101_120000_123456
std::string get_file_timestamp();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern);
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Glob pattern matching (case-insensitive, ';' separates alternatives)
bool glob_match(const std::string& pattern, const std::string& str);

// Replaces every "{key}" in tmpl with values.at(key). Unknown keys are kept.
std::string substitute_placeholders(const std::string& tmpl,
                                    const std::map<std::string, std::string>& values);

// Single-quotes s for a POSIX shell
std::string shell_quote(const std::string& s);

// Runs a shell command, returns its exit status (-1 if it could not be started).
int run_shell_command(const std::string& command);

// Worker count for task_count independent tasks: requested clamped to
// [1, hardware concurrency] and to task_count.
int compute_worker_count(int requested, std::size_t task_count);

} // namespace tile_link::core
