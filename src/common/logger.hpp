#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pdict {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger "pdict" (for components that don't
// belong to a specific store: benchmark tool, early startup messages, tests).
// Safe to call more than once; later calls only change the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) the logger of one store.
//   store_name – embedded in every log line as [store:<name>]
// New loggers inherit the default logger's level.
std::shared_ptr<spdlog::logger> make_store_logger(std::string_view store_name);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace pdict
