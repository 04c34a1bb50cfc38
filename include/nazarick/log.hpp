/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <syslog.h>

namespace nazarick {

enum class log_type {
    STDERR,
    SYSLOG,
    JOURNALD,
    FILE
};

constexpr const char *DEFAULT_LOG_FILE = "logs/log.txt";

/// Select process-wide sink. Records with level above max_level are dropped.
/// path is used only by log_type::FILE and must stay valid until the next
/// openlog() or closelog(). The file and its parent directory are created
/// on the first record. Without openlog() records go to stderr.
/// Source locations are enabled for JOURNALD and SYSLOG and disabled for
/// the others, log_setup_locations() overrides it.
void openlog(log_type type, int max_level, const char *path = nullptr)
    noexcept;

void log_setup_locations(int enable) noexcept;
int log_locations_enabled() noexcept;

void closelog() noexcept;
int log_max_level() noexcept;

void log(int level, const char *format, ...) noexcept;
void log_with_location(int level, const char *loc_format,
        const char *src_format, ...) noexcept;

void log_uv_err(int level, const char *msg, int error) noexcept;
void log_uv_err_with_location(int level, const char *msg, int error,
        const char *func, const char *file, int line) noexcept;

void log_syserr(int level, const char *msg) noexcept;
void log_syserr_with_location(int level, const char *msg,
        const char *func, const char *file, int line) noexcept;

/// Name of syslog level in records: ERROR, WARN, INFO or DEBUG.
const char * log_level_name(int level) noexcept;

} // namespace nazarick

#define nazarick_log1(level, format, ...) \
    ::nazarick::log_with_location(level, \
            "CODE_FUNC=%s CODE_FILE=%s CODE_LINE=%d " format, format, \
            __PRETTY_FUNCTION__, __FILE__, int(__LINE__), ##__VA_ARGS__)

#define nazarick_log(...) nazarick_log1(__VA_ARGS__, "")

#define nazarick_log_uv_err(level, msg, error) \
    ::nazarick::log_uv_err_with_location(level, msg, error, \
            __PRETTY_FUNCTION__, __FILE__, __LINE__)

#define nazarick_log_syserr(level, msg) \
    ::nazarick::log_syserr_with_location(level, msg, \
            __PRETTY_FUNCTION__, __FILE__, __LINE__)
