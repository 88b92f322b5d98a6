#pragma once

/*here you can choose the default terminal driver and its compile-time defaults;
  Settings (settings.hpp) may override them at run time*/

#define TBOX_DRIVER_NCURSES  1
#define TBOX_DRIVER_HEADLESS 2

#ifndef TBOX_DRIVER
#define TBOX_DRIVER TBOX_DRIVER_NCURSES
#endif

#if TBOX_DRIVER != TBOX_DRIVER_NCURSES && TBOX_DRIVER != TBOX_DRIVER_HEADLESS
#error "TBOX_DRIVER must be TBOX_DRIVER_NCURSES or TBOX_DRIVER_HEADLESS"
#endif

/* ms ncurses waits after ESC before reporting it as a lone key */
#ifndef TBOX_ESC_DELAY_MS
#define TBOX_ESC_DELAY_MS 25
#endif

#ifndef TBOX_HEADLESS_WIDTH
#define TBOX_HEADLESS_WIDTH 80
#endif
#ifndef TBOX_HEADLESS_HEIGHT
#define TBOX_HEADLESS_HEIGHT 24
#endif

/* trace, debug, info, warn, error, off */
#ifndef TBOX_LOG_LEVEL
#define TBOX_LOG_LEVEL "warn"
#endif

#define TBOX_RC_NAME ".tboxrc"
#define TBOX_LOGGER_NAME "tbox"
