#pragma once

#include <string>

// Debug log file: <tmp>/termkeep_debug.log unless overridden by config.
std::string termkeep_log_path();
void set_termkeep_log_path(const std::string& path);

// Append "[HH:MM:SS.mmm] msg" to the debug log. Never throws.
void termkeep_log(const std::string& msg);
