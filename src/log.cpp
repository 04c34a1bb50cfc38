/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/log.hpp>

#include <cassert>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <systemd/sd-journal.h>
#include <unistd.h>

#include <uv.h>

namespace nazarick {

namespace {

/// "2024-01-31T12:00:00.123Z LEVEL: message\n"
std::string format_record(int level, const char *fmt, va_list v)
{
    std::string record;
    timespec ts;
    tm t;
    char stamp[40];
    size_t n = 0;
    if (clock_gettime(CLOCK_REALTIME, &ts) == 0 && gmtime_r(&ts.tv_sec, &t))
        n = strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &t);
    if (n) {
        record.assign(stamp, n);
        snprintf(stamp, sizeof(stamp), ".%03ldZ", ts.tv_nsec / 1000000);
        record += stamp;
    }
    else
        record = "-";
    record += ' ';
    record += log_level_name(level);
    record += ": ";

    char buf[1024];
    va_list v2;
    va_copy(v2, v);
    int len = vsnprintf(buf, sizeof(buf), fmt, v2);
    va_end(v2);
    if (len < 0)
        len = 0;
    else if (len < (int)sizeof(buf))
        record.append(buf, len);
    else {
        size_t prefix = record.size();
        record.resize(prefix + len + 1);
        vsnprintf(&record[prefix], len + 1, fmt, v);
        record.resize(prefix + len);
    }
    record += '\n';
    return record;
}

class logger {
public:
    virtual ~logger() {}
    virtual void close() {}
    void set_max_level(int level) { max_level = level; }
    int get_max_level() const { return max_level; }
    void log(int level, const char *format, va_list va)
    {
        if (level <= max_level)
            write_log(level, format, va);
    }

    static logger *current;

protected:
    virtual void write_log(int level, const char *fmt, va_list va) = 0;

private:
    int max_level = LOG_INFO;
};

logger * logger::current = nullptr;

class stderr_logger : public logger {
public:
    static void write_record(int level, const char *fmt, va_list v)
    {
        std::string record = format_record(level, fmt, v);
        fwrite(record.data(), 1, record.size(), stderr);
        fflush(stderr);
    }

    static stderr_logger & instance()
    {
        static stderr_logger inst;
        return inst;
    }

protected:
    virtual void write_log(int level, const char *fmt, va_list v) override
    {
        write_record(level, fmt, v);
    }
};

class syslog_logger : public logger {
public:
    void open()
    {
        if (!opened)
            ::openlog("nazarickd", LOG_PID, LOG_DAEMON);
        opened = true;
    }

    virtual void close() override
    {
        if (opened)
            ::closelog();
        opened = false;
    }

    static syslog_logger & instance()
    {
        static syslog_logger inst;
        return inst;
    }

protected:
    virtual void write_log(int level, const char *fmt, va_list v) override
    {
        ::vsyslog(level, fmt, v);
    }

private:
    bool opened = false;
};

class journald_logger : public logger {
public:
    static journald_logger & instance()
    {
        static journald_logger inst;
        return inst;
    }

protected:
    virtual void write_log(int level, const char *fmt, va_list v) override
    {
        sd_journal_printv(level, fmt, v);
    }
};

/// Append-only file opened on the first record.
class file_logger : public logger {
public:
    ~file_logger()
    {
        close();
    }

    void set_path(const char *new_path)
    {
        close();
        path = new_path;
    }

    virtual void close() override
    {
        if (fd != -1)
            ::close(fd);
        fd = -1;
    }

    static file_logger & instance()
    {
        static file_logger inst;
        return inst;
    }

protected:
    virtual void write_log(int level, const char *fmt, va_list v) override
    {
        if (fd == -1 && !open_file())
            return stderr_logger::write_record(level, fmt, v);

        std::string record = format_record(level, fmt, v);
        // O_APPEND and one write per record keep records of concurrent
        // writers whole.
        ssize_t r;
        while ((r = ::write(fd, record.data(), record.size())) == -1 &&
                errno == EINTR) {}
        if (r == -1)
            fprintf(stderr, "Can't write log file %s: %s\n", path,
                    strerror(errno));
    }

private:
    bool open_file()
    {
        if (!path)
            return false;
        const char *slash = strrchr(path, '/');
        if (slash && slash != path) {
            std::string dir(path, slash);
            if (mkdir(dir.c_str(), 0755) == -1 && errno != EEXIST) {
                fprintf(stderr, "Can't create log directory %s: %s\n",
                        dir.c_str(), strerror(errno));
                return false;
            }
        }
        fd = ::open(path, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd == -1) {
            fprintf(stderr, "Can't open log file %s: %s\n", path,
                    strerror(errno));
            return false;
        }
        return true;
    }

    const char *path = nullptr;
    int fd = -1;
};

int locations_enabled = 1;

void vlog(int level, const char *format, va_list va)
{
    if (logger::current)
        logger::current->log(level, format, va);
    else
        stderr_logger::write_record(level, format, va);
}

} // namespace

void openlog(log_type type, int max_level, const char *path) noexcept
{
    if (logger::current)
        logger::current->close();
    switch (type) {
    case log_type::STDERR:
        logger::current = &stderr_logger::instance();
        break;
    case log_type::SYSLOG:
        syslog_logger::instance().open();
        logger::current = &syslog_logger::instance();
        break;
    case log_type::JOURNALD:
        logger::current = &journald_logger::instance();
        break;
    case log_type::FILE:
        file_logger::instance().set_path(path ? path : DEFAULT_LOG_FILE);
        logger::current = &file_logger::instance();
        break;
    }
    assert(logger::current);
    logger::current->set_max_level(max_level);
    // Text records are "timestamp LEVEL: message", journald and syslog
    // keep the source location.
    locations_enabled = type == log_type::JOURNALD || type == log_type::SYSLOG;
}

void closelog() noexcept
{
    if (!logger::current)
        return;
    logger::current->close();
    logger::current = nullptr;
}

int log_max_level() noexcept
{
    return logger::current ? logger::current->get_max_level() : LOG_DEBUG;
}

void log_setup_locations(int enable) noexcept
{
    locations_enabled = enable;
}

int log_locations_enabled() noexcept
{
    return locations_enabled;
}

const char * log_level_name(int level) noexcept
{
    if (level <= LOG_ERR)
        return "ERROR";
    if (level == LOG_WARNING)
        return "WARN";
    if (level <= LOG_INFO)
        return "INFO";
    return "DEBUG";
}

void log(int level, const char *format, ...) noexcept
{
    va_list va;
    va_start(va, format);
    vlog(level, format, va);
    va_end(va);
}

void log_with_location(int level, const char *loc_format,
        const char *src_format, ...) noexcept
{
    va_list va;
    va_start(va, src_format);
    if (locations_enabled)
        vlog(level, loc_format, va);
    else {
        va_arg(va, const char *); // CODE_FUNC
        va_arg(va, const char *); // CODE_FILE
        va_arg(va, int); // CODE_LINE
        vlog(level, src_format, va);
    }
    va_end(va);
}

void log_syserr(int level, const char *msg) noexcept
{
    log(level, "%s: %s.", msg, strerror(errno));
}

void log_syserr_with_location(int level, const char *msg,
        const char *func, const char *file, int line) noexcept
{
    int err = errno;
    log_with_location(level,
            "CODE_FUNC=%s CODE_FILE=%s CODE_LINE=%d. %s: %s.", "%s: %s.",
            func, file, line, msg, strerror(err));
}

void log_uv_err(int level, const char *msg, int error) noexcept
{
    log(level, "%s: %s (%s).", msg, uv_strerror(error), uv_err_name(error));
}

void log_uv_err_with_location(int level, const char *msg, int error,
        const char *func, const char *file, int line) noexcept
{
    log_with_location(level,
            "CODE_FUNC=%s CODE_FILE=%s CODE_LINE=%d. %s: %s (%s).",
            "%s: %s (%s).",
            func, file, line, msg, uv_strerror(error), uv_err_name(error));
}

} // namespace nazarick
