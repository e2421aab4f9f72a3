#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "output_cleaner.hpp"

// Sentinel protocol for running one command in an interactive shell.
//
// The command is bracketed by three echoes the shell prints as it goes:
//   echo '===START<id>==='
//   <command>
//   echo '===EXIT<id>==='$?
//   echo '===END<id>==='
// The END marker printed on a line of its own means the command is done;
// the terminal's echo of the typed echo line carries it too, followed by
// the closing quote, and does not count.
// The id is the issue time in milliseconds; two commands on one session
// can never be in flight together, so it only has to differ from the
// previous command's id.

struct MarkerResult {
    std::string output;
    std::optional<int> exit_code;
    bool found;   // both markers present and correctly ordered
};

MarkerSet make_markers(int64_t id);

// The four writes, each newline-terminated, in the order they must be sent.
std::vector<std::string> build_marker_writes(const MarkerSet& markers,
                                             const std::string& command);

// Extract the command's output and exit status from everything the shell
// printed since the command was issued.
// When START and END are missing or out of order, falls back to the whole
// cleaned buffer with exit code 0 (found == false).
MarkerResult parse_marker_output(const std::string& raw,
                                 const MarkerSet& markers,
                                 const std::string& command);

// First "<exit marker><digits>" in raw, if any.
std::optional<int> find_exit_code(const std::string& raw, const std::string& exit_marker);

// True once the shell has printed `marker` itself, as opposed to echoing
// the line that prints it.
bool marker_printed(const std::string& raw, const std::string& marker);
