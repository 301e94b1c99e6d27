#pragma once

#include <string>

// Writes `msg` plus a newline to stderr as one unit, so lines from different
// threads never interleave.
void log_line(const std::string& msg);

// Like perror(): appends strerror(errno).
void log_errno(const std::string& what);

void set_log_enabled(bool on);
