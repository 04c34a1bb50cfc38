/*
 * Copyright (C) Andrey Pikas
 */

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>

#include <getopt.h>
#include <sys/stat.h>
#include <unistd.h>

#include <uv.h>

#include <nazarick/http_server.hpp>
#include <nazarick/log.hpp>

std::unique_ptr<nazarick::http_server> server;

void stop_handler(uv_signal_t * /*handle*/, int signum)
{
    nazarick::log(LOG_NOTICE, "Received signal %d", signum);
    if (server)
        server->stop();
}

int parse_int_arg(const char *s, const char *optname)
{
    char *endptr = nullptr;
    errno = 0;
    long res = strtol(s, &endptr, 0);
    if ((res == LONG_MAX && errno == ERANGE) || res > INT_MAX || res < 0) {
        nazarick::log(LOG_EMERG, "Option \"%s\" value \"%s\" is out of range",
                optname, s);
        exit(EXIT_FAILURE);
    }

    if (endptr == s || *endptr) {
        nazarick::log(LOG_EMERG,
                "Option \"%s\" has non unsigned integer value", optname);
        exit(EXIT_FAILURE);
    }

    return (int)res;
}

int main(int argc, char * const *argv)
{
    uv_disable_stdio_inheritance();

    int daemon = 0;
    int journald = 0;
    int log_level = LOG_INFO;
    int idle_timeout = (int)nazarick::http_server::IDLE_TIMEOUT;
    const char *listen_addr = "127.0.0.1";
    int listen_port = 3320;
    const char *log_file = nullptr;
    for (;;) {
        static const option opts[] = {
            {"daemon", no_argument, &daemon, 1},
            {"journald", no_argument, &journald, 1},
            {"loglevel", required_argument, &log_level, LOG_INFO},
            {"listen-addr", required_argument, nullptr, 1},
            {"listen-port", required_argument, &listen_port, 3320},
            {"idle-timeout", required_argument, &idle_timeout, 0},
            {"log-file", required_argument, nullptr, 2},
            {0, 0, nullptr, 0}
        };

        int opt_idx = 0;
        int c = getopt_long(argc, argv, "", opts, &opt_idx);
        if (c == -1)
            break;
        if (c == 0) {
            if (optarg)
                *opts[opt_idx].flag = parse_int_arg(optarg, opts[opt_idx].name);
        }
        else if (c == 1)
            listen_addr = optarg;
        else if (c == 2)
            log_file = optarg;
        else {
            nazarick::log(LOG_EMERG, "Unknown option");
            exit(EXIT_FAILURE);
        }
    }

    if (log_file)
        nazarick::openlog(nazarick::log_type::FILE, log_level, log_file);
    else if (daemon || journald)
        nazarick::openlog(nazarick::log_type::JOURNALD, log_level);
    else
        nazarick::openlog(nazarick::log_type::STDERR, log_level);

    if (daemon) {
        nazarick::log(LOG_NOTICE, "Begin daemon initialization.");

        pid_t pid = fork();
        if (pid < 0) {
            nazarick_log_syserr(LOG_EMERG, "fork failed at start");
            return EXIT_FAILURE;
        }
        if (pid > 0)
            return EXIT_SUCCESS;
        umask(0);
        if (setsid() < 0)
            nazarick_log_syserr(LOG_ERR, "setsid failed at start");

        nazarick::log(LOG_NOTICE, "Daemon started.");
    }

    int r;
    uv_loop_t loop;
    if ((r = uv_loop_init(&loop)) < 0) {
        nazarick::log_uv_err(LOG_EMERG, "uv_loop_init main loop", r);
        return EXIT_FAILURE;
    }

    uv_signal_t sig[3];
    int signum[3] = {SIGTERM, SIGINT, SIGHUP};
    for (size_t i = 0; i < sizeof(sig) / sizeof(*sig); ++i)
        if ((r = uv_signal_init(&loop, &sig[i])) < 0) {
            nazarick::log_uv_err(LOG_ERR, "uv_signal_init", r);
            uv_close((uv_handle_t *)&sig[i], nullptr);
        }
        else if ((r = uv_signal_start(&sig[i], stop_handler, signum[i])) < 0) {
            nazarick::log_uv_err(LOG_ERR, "uv_signal_start", r);
            uv_close((uv_handle_t *)&sig[i], nullptr);
        }
        else
            uv_unref((uv_handle_t *)&sig[i]);

    int exit_code = EXIT_SUCCESS;
    server.reset(new nazarick::http_server);
    server->set_idle_timeout(idle_timeout);
    if (!server->start(&loop, listen_addr, listen_port)) {
        nazarick::log(LOG_EMERG, "Can't start server on %s:%d",
                listen_addr, listen_port);
        exit_code = EXIT_FAILURE;
    }
    else
        nazarick::log(LOG_NOTICE, "Serving on %s:%d",
                listen_addr, server->port());

    uv_run(&loop, UV_RUN_DEFAULT);
    server.reset();

    for (uv_signal_t &sigi : sig) {
        if (uv_is_closing((uv_handle_t *)&sigi))
            continue;
        if ((r = uv_signal_stop(&sigi)) < 0)
            nazarick::log_uv_err(LOG_ERR, "uv_signal_stop", r);
        uv_close((uv_handle_t *)&sigi, nullptr);
    }
    // Do one loop iteration to remove signal handlers from loop.
    uv_run(&loop, UV_RUN_NOWAIT);

    if ((r = uv_loop_close(&loop)) < 0)
        nazarick::log_uv_err(LOG_ERR, "uv_loop_close main loop", r);

    if (daemon)
        nazarick::log(LOG_NOTICE, "Daemon stopped.");
    nazarick::closelog();

    return exit_code;
}
