#include "vbtfix_shared/logging.h"

#include <cstdio>
#include <iostream>

#include <unistd.h>

static const char *COLOR_RED = "\033[0;31m";
static const char *COLOR_GREEN = "\033[0;32m";
static const char *COLOR_YELLOW = "\033[1;33m";
static const char *COLOR_NONE = "\033[0m";

std::string log_format_line(const char *level, const char *color,
                            const std::string &msg, std::time_t when)
{
    std::tm local;
    char stamp[32];
    std::string line;

    if (!localtime_r(&when, &local) ||
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local) == 0) {
        stamp[0] = '\0';
    }
    line = std::string("[") + stamp + "][";
    if (color) {
        line += color;
        line += level;
        line += COLOR_NONE;
    } else {
        line += level;
    }
    line += "] ";
    line += msg;
    return line;
}

static void log_common(const char *level, const char *color, const std::string &msg,
                       std::ostream &os, int fd)
{
    os << log_format_line(level, isatty(fd) ? color : 0, msg, std::time(0)) << std::endl;
}

void log_info(const std::string &msg)
{
    log_common("INFO", COLOR_GREEN, msg, std::cout, STDOUT_FILENO);
}

void log_warn(const std::string &msg)
{
    log_common("WARN", COLOR_YELLOW, msg, std::cout, STDOUT_FILENO);
}

void log_error(const std::string &msg)
{
    std::cout.flush();
    log_common("ERROR", COLOR_RED, msg, std::cerr, STDERR_FILENO);
}

void log_plain(const std::string &msg)
{
    std::cout << msg << std::endl;
}
