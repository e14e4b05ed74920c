#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace logger {

// Levels: 0=DEBUG,1=INFO,2=WARN,3=ERROR
enum Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Initialize logging to optionally write to a file in addition to stdout.
// The file is rotated once it grows past max_bytes, keeping backup_count old copies.
void set_log_file(const std::string& path,
                  std::size_t max_bytes = 10 * 1024 * 1024,
                  int backup_count = 5);   // empty path disables file logging
void set_level(int level);
// "DEBUG" | "INFO" | "WARN" | "WARNING" | "ERROR" (case-insensitive). Unknown names keep INFO.
void set_level_name(const std::string& name);
int level();

// Log APIs
void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

// In-memory ring buffer APIs
// Returns a copy of current log lines (thread-safe snapshot).
std::vector<std::string> lines();

// Clears the in-memory buffer (does not affect file/stdout).
void clear();

// Current number of lines in the in-memory buffer.
std::size_t line_count();

} // namespace logger
