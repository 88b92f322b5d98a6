#pragma once
/*
 * Log
 *
 * Purpose: the library's spdlog logger.
 * Note: the terminal owns stdout/stderr, so output goes to a file sink or nowhere.
 *       Until configure_logging() runs the logger discards everything.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

struct Settings;

std::shared_ptr<spdlog::logger> tbox_logger();
// replaces the sinks according to settings (log_file, log_level);
// false with msg when the log file can not be opened (logging is then discarded)
bool configure_logging(const Settings& settings, std::string& msg);

#define TBOX_LOG() (tbox_logger())
