#ifndef VBTFIX_SHARED_LOGGING_H
#define VBTFIX_SHARED_LOGGING_H

#include <ctime>
#include <string>

void log_info(const std::string &msg);
void log_warn(const std::string &msg);
void log_error(const std::string &msg);

/* Plain line on stdout, no timestamp or level (banners, blank lines). */
void log_plain(const std::string &msg);

/* "[YYYY-MM-DD HH:MM:SS][LEVEL] msg" in local time, without a newline.
 * A non-null color wraps the level tag in that escape and a reset. */
std::string log_format_line(const char *level, const char *color,
                            const std::string &msg, std::time_t when);

#endif /* VBTFIX_SHARED_LOGGING_H */
