#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace pagekv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Install the global default logger ("pagekv"), writing to stderr so that
// command output on stdout stays machine-readable.
// Call once at program start before any logging; later calls only change the
// level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace pagekv
