#pragma once

#include "core/Config.h"

namespace ViewPane::Core::Logging {

constexpr const char* kLoggerName = "viewpane";

// Install the default spdlog logger. With no log file configured, output
// is discarded so nothing is written over the curses screen.
// Returns false (and discards output) if the log file cannot be opened.
bool Initialize(const LoggingConfig& config);

// Flush and close the log file; later log calls are discarded
void Shutdown();

} // namespace ViewPane::Core::Logging
