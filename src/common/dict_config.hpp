#pragma once

#include "dict/persistent_dict.hpp"
#include "storage/shared_store.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace pdict {

// ── DictConfig ────────────────────────────────────────────────────────────────
// Command-line view of DictOptions, for tools built on the dictionary.
// Populated by parse_config() / config_from().

struct DictConfig {
    std::string path;               // Database directory
    Engine      engine;             // --engine: "rocksdb" (default) or "memory"
    Isolation   isolation;          // --isolation: "serialized" or "engine-native"
    int         compress_level;     // zlib level 0..9
    uint32_t    lock_timeout_ms;    // 0 waits forever
    bool        sync;               // fsync every write
    std::string log_level;          // spdlog level string
};

// ── String helpers ────────────────────────────────────────────────────────────
// Throw std::runtime_error on unknown names.

[[nodiscard]] Engine parse_engine(std::string_view s);
[[nodiscard]] Isolation parse_isolation(std::string_view s);

// ── add_options ───────────────────────────────────────────────────────────────
// Register the dictionary options on `desc`. Tools add their own options to
// the same description.

void add_options(boost::program_options::options_description& desc);

// ── config_from ───────────────────────────────────────────────────────────────
// Read and validate a DictConfig from a notified variables_map.
//
// Validates:
//   - path is not empty (unless engine is memory)
//   - compress_level in [0, 9]
//   - engine and isolation names are known
//
// Throws std::runtime_error with a human-readable message.

[[nodiscard]] DictConfig config_from(const boost::program_options::variables_map& vm);

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a DictConfig. --help throws std::runtime_error
// carrying the help text.

[[nodiscard]] DictConfig parse_config(int argc, char* argv[]);

// ── to_options ────────────────────────────────────────────────────────────────

[[nodiscard]] DictOptions to_options(const DictConfig& cfg);

} // namespace pdict
