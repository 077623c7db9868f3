#include "common/dict_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace pdict {

namespace {

// Validate the fully populated DictConfig.
void validate(const DictConfig& cfg) {
    if (cfg.path.empty() && cfg.engine != Engine::Memory) {
        throw std::runtime_error("--path must not be empty");
    }
    if (cfg.compress_level < 0 || cfg.compress_level > 9) {
        throw std::runtime_error(
            fmt::format("--compress-level must be in [0, 9], got {}", cfg.compress_level));
    }
}

} // anonymous namespace

// ── String helpers ────────────────────────────────────────────────────────────

Engine parse_engine(std::string_view s) {
    if (s == "rocksdb") return Engine::RocksDB;
    if (s == "memory")  return Engine::Memory;
    throw std::runtime_error(
        fmt::format("--engine must be 'rocksdb' or 'memory', got '{}'", s));
}

Isolation parse_isolation(std::string_view s) {
    if (s == "serialized")    return Isolation::Serialized;
    if (s == "engine-native") return Isolation::EngineNative;
    throw std::runtime_error(
        fmt::format("--isolation must be 'serialized' or 'engine-native', got '{}'", s));
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("path",
            po::value<std::string>()->default_value("./pdict-data"),
            "Database directory")
        ("engine",
            po::value<std::string>()->default_value("rocksdb"),
            "Storage engine: rocksdb (default) or memory")
        ("isolation",
            po::value<std::string>()->default_value("serialized"),
            "Concurrency mode: serialized (default) or engine-native")
        ("compress-level",
            po::value<int>()->default_value(ZlibCompressor::kDefaultLevel),
            "zlib compression level, 0 (store) to 9 (best)")
        ("lock-timeout-ms",
            po::value<uint32_t>()->default_value(10'000),
            "Milliseconds to wait for a store lock; 0 waits forever")
        ("sync",
            po::bool_switch()->default_value(false),
            "fsync the write-ahead log on every write")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── config_from ───────────────────────────────────────────────────────────────

DictConfig config_from(const po::variables_map& vm) {
    DictConfig cfg;
    cfg.path            = vm["path"].as<std::string>();
    cfg.engine          = parse_engine(vm["engine"].as<std::string>());
    cfg.isolation       = parse_isolation(vm["isolation"].as<std::string>());
    cfg.compress_level  = vm["compress-level"].as<int>();
    cfg.lock_timeout_ms = vm["lock-timeout-ms"].as<uint32_t>();
    cfg.sync            = vm["sync"].as<bool>();
    cfg.log_level       = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

// ── parse_config ──────────────────────────────────────────────────────────────

DictConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("pdict options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    return config_from(vm);
}

// ── to_options ────────────────────────────────────────────────────────────────

DictOptions to_options(const DictConfig& cfg) {
    DictOptions options;
    options.engine         = cfg.engine;
    options.isolation      = cfg.isolation;
    options.lock_timeout   = std::chrono::milliseconds(cfg.lock_timeout_ms);
    options.sync_writes    = cfg.sync;
    options.compress_level = cfg.compress_level;
    return options;
}

} // namespace pdict
