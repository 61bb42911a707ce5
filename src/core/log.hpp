#pragma once

#include <string>
#include <core/types.hpp>

// Append-only debug log shared by the transport thread and the console.
// Defaults to <tmp>/rterm_debug.log; configure once at startup.
void configure_log(const LogConfig& cfg);

std::string rterm_log_path();

// Append a timestamped line ("[HH:MM:SS.mmm] msg"). Never throws.
void rterm_log(const std::string& msg);
