#include "log.hpp"
#include "config.hpp"
#include "settings.hpp"
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static std::mutex& logger_mutex() {
  static std::mutex m;
  return m;
}

static std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> logger =
    std::make_shared<spdlog::logger>(TBOX_LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

std::shared_ptr<spdlog::logger> tbox_logger() {
  std::lock_guard<std::mutex> lk(logger_mutex());
  return logger_slot();
}

bool configure_logging(const Settings& settings, std::string& msg) {
  spdlog::sink_ptr sink;
  bool ok = true;
  if (!settings.log_file.empty()) {
    try {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.log_file, false);
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("can not open log file: ") + e.what();
      ok = false;
    }
  }
  if (!sink) sink = std::make_shared<spdlog::sinks::null_sink_mt>();

  auto logger = std::make_shared<spdlog::logger>(TBOX_LOGGER_NAME, sink);
  logger->set_level(spdlog::level::from_str(settings.log_level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
  logger->flush_on(spdlog::level::warn);
  {
    std::lock_guard<std::mutex> lk(logger_mutex());
    logger_slot() = logger;
  }
  return ok;
}
