#pragma once

#include <string>
#include <optional>

// Output cleaning pipeline for text captured from a pseudo-terminal.
//
// Stages must run in this order, each over the whole text (stage 1 can
// merge or split the lines later stages key on):
//   1. clean_output        control sequences, CR/BS/BEL, blank-line runs
//   2. clean_markers       sentinel marker lines and their echo commands
//   3. clean_command_echo  blank lines and the first echo of the command
//   4. clean_prompt        shell prompt lines
//
// Stages 3 and 4 are heuristics: a legitimate output line that looks like
// a prompt or contains the command's first word can be removed, and an
// unfamiliar prompt style can survive.

struct MarkerSet {
    std::string start;
    std::string end;
    std::string exit;
};

// Strip ANSI escape/control sequences, turn CRLF and lone CR into LF, drop
// backspace and bell, collapse 3+ newlines into one blank line, right-trim
// each line and trim the whole text.
std::string clean_output(const std::string& output);

// Drop lines containing any marker, and `echo '...===` marker commands.
std::string clean_markers(const std::string& output, const MarkerSet& markers);

// Drop blank lines and the first line containing the command's first
// space-separated word.
std::string clean_command_echo(const std::string& output, const std::string& command);

// Drop lines shaped like shell prompts and prompt+marker-echo artifacts.
std::string clean_prompt(const std::string& output);

// All four stages plus a final trim. Marker stage is skipped without markers.
std::string full_clean_output(const std::string& output,
                              const std::string& command,
                              const std::optional<MarkerSet>& markers = std::nullopt);
