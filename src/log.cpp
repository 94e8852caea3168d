#include "chanvault/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace chanvault {

namespace {
std::atomic<bool> g_verbose{false};
std::atomic<FILE*> g_output{nullptr};

FILE* info_stream() {
    FILE* out = g_output.load(std::memory_order_relaxed);
    return out ? out : stdout;
}

FILE* error_stream() {
    FILE* out = g_output.load(std::memory_order_relaxed);
    return out ? out : stderr;
}
}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void set_log_output(FILE* out) {
    g_output.store(out, std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    FILE* out = info_stream();
    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);
    fputc('\n', out);
    fflush(out);
}

void log_error(const char* fmt, ...) {
    FILE* out = error_stream();
    va_list args;
    va_start(args, fmt);
    fprintf(out, "ERROR: ");
    vfprintf(out, fmt, args);
    va_end(args);
    fputc('\n', out);
    fflush(out);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    FILE* out = info_stream();
    va_list args;
    va_start(args, fmt);
    fprintf(out, "DEBUG: ");
    vfprintf(out, fmt, args);
    va_end(args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace chanvault
