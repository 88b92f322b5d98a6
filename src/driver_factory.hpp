#pragma once
/*
 * Driver factory
 *
 * Purpose: build the ITermDriver named by Settings (ncurses or headless).
 */
#include <memory>
#include "iterm_driver.hpp"

struct Settings;

std::unique_ptr<ITermDriver> make_driver(const Settings& settings);
