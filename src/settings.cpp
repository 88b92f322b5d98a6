#include "settings.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || end != s.data() + s.size()) return false;
  out = v;
  return true;
}

static bool valid_level(const std::string& s) {
  static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
  return std::any_of(std::begin(levels), std::end(levels), [&](const char* l){ return s == l; });
}

Settings Settings::defaults() {
  Settings s;
#if TBOX_DRIVER == TBOX_DRIVER_HEADLESS
  s.driver = DriverKind::Headless;
#else
  s.driver = DriverKind::Ncurses;
#endif
  s.log_level = TBOX_LOG_LEVEL;
  s.esc_delay_ms = TBOX_ESC_DELAY_MS;
  s.headless_size = {TBOX_HEADLESS_WIDTH, TBOX_HEADLESS_HEIGHT};
  return s;
}

Settings Settings::load() {
  Settings s = defaults();
  if (auto p = rc_path()) s.apply_rc_file(*p);
  s.apply_env();
  return s;
}

bool Settings::apply(const std::string& key, const std::string& raw_value) {
  std::string value = trim(raw_value);
  if (key == "driver") {
    std::string v = to_lower(value);
    if (v == "ncurses") { driver = DriverKind::Ncurses; return true; }
    if (v == "headless") { driver = DriverKind::Headless; return true; }
    messages.push_back("driver: use ncurses|headless");
    return false;
  }
  if (key == "log_file") { log_file = value; return true; }
  if (key == "log_level") {
    std::string v = to_lower(value);
    if (!valid_level(v)) { messages.push_back("log_level: use trace|debug|info|warn|error|off"); return false; }
    log_level = v;
    return true;
  }
  if (key == "esc_delay") {
    int ms = 0;
    if (!parse_int(value, ms)) { messages.push_back("esc_delay: delay must be a number"); return false; }
    if (ms < 0) { messages.push_back("esc_delay: delay must be >= 0"); return false; }
    esc_delay_ms = ms;
    return true;
  }
  if (key == "headless_size") {
    size_t x = value.find_first_of("xX");
    int w = 0, h = 0;
    if (x == std::string::npos || !parse_int(value.substr(0, x), w) || !parse_int(value.substr(x + 1), h)) {
      messages.push_back("headless_size: use <width>x<height>");
      return false;
    }
    if (w < 1 || h < 1) { messages.push_back("headless_size: width and height must be >= 1"); return false; }
    headless_size = {w, h};
    return true;
  }
  messages.push_back("unknown setting: " + key);
  return false;
}

void Settings::apply_rc_lines(const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    std::string s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    size_t eq = s.find('=');
    if (eq == std::string::npos) { messages.push_back("expected key = value: " + s); continue; }
    apply(trim(s.substr(0, eq)), s.substr(eq + 1));
  }
}

bool Settings::apply_rc_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return false;
  std::ifstream in(path);
  if (!in) { messages.push_back("can not open file: " + path.string()); return false; }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  apply_rc_lines(lines);
  return true;
}

void Settings::apply_env() {
  static const struct { const char* env; const char* key; } vars[] = {
    {"TBOX_DRIVER", "driver"},
    {"TBOX_LOG_FILE", "log_file"},
    {"TBOX_LOG_LEVEL", "log_level"},
    {"TBOX_ESCDELAY", "esc_delay"},
    {"TBOX_HEADLESS_SIZE", "headless_size"},
  };
  for (const auto& v : vars) {
    if (const char* value = std::getenv(v.env)) apply(v.key, value);
  }
}

std::optional<std::filesystem::path> rc_path() {
  if (const char* rc = std::getenv("TBOX_RC")) {
    if (*rc) return std::filesystem::path(rc);
  }
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / TBOX_RC_NAME;
}
