#include "driver_factory.hpp"
#include "headless_driver.hpp"
#include "log.hpp"
#include "ncurses_driver.hpp"
#include "settings.hpp"

std::unique_ptr<ITermDriver> make_driver(const Settings& settings) {
  switch (settings.driver) {
    case DriverKind::Headless:
      TBOX_LOG()->debug("using headless driver {}x{}", settings.headless_size.width, settings.headless_size.height);
      return std::make_unique<HeadlessDriver>(settings.headless_size.width, settings.headless_size.height);
    case DriverKind::Ncurses:
      break;
  }
  TBOX_LOG()->debug("using ncurses driver, esc delay {}ms", settings.esc_delay_ms);
  return std::make_unique<NcursesDriver>(settings.esc_delay_ms);
}
