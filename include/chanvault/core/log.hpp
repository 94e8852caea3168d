#pragma once

#include <cstdio>

namespace chanvault {

/// Enable or disable debug output from log_debug().
void set_verbose(bool verbose);
bool is_verbose();

/// Send every log line to out. nullptr restores the default split:
/// info and debug on stdout, errors on stderr.
void set_log_output(FILE* out);

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only printed when verbose output is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace chanvault
