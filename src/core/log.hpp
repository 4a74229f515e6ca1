#pragma once

#include <string>

// Path of the debug log (default: <temp_dir>/cardsync_debug.log)
std::string cardsync_log_path();

// Redirect the debug log, e.g. from config. Empty restores the default.
void set_log_path(const std::string& path);

// Append a timestamped line to the debug log. Safe to call from any thread.
void cardsync_log(const std::string& msg);
