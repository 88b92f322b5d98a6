#pragma once
/*
 * Settings
 *
 * Purpose: run-time configuration (driver choice, logging, ESC delay, headless size).
 * Sources: compile-time defaults from config.hpp, then the rc file
 *          ($TBOX_RC or $HOME/.tboxrc), then TBOX_* environment variables.
 * Note: bad values keep the previous setting and leave a line in `messages`.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class DriverKind { Ncurses, Headless };

struct Settings {
  DriverKind driver;
  std::string log_file;   // empty: logging discarded
  std::string log_level;
  int esc_delay_ms;
  TermSize headless_size;
  std::vector<std::string> messages;

  static Settings defaults();
  // defaults + rc file + environment
  static Settings load();

  // one `key = value` assignment; false (and a message) when rejected
  bool apply(const std::string& key, const std::string& value);
  void apply_rc_lines(const std::vector<std::string>& lines);
  bool apply_rc_file(const std::filesystem::path& path);
  void apply_env();
};

std::optional<std::filesystem::path> rc_path();
