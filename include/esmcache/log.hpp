#pragma once

namespace esmcache {

/// Enable or disable log_debug output (the --verbose flag).
void set_verbose(bool verbose);
bool is_verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only printed in verbose mode.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace esmcache
