#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace pdict {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

// spdlog's registry rejects duplicate names; serialise get-or-create.
std::mutex& registry_mutex() {
    static std::mutex m;
    return m;
}

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    std::lock_guard lock(registry_mutex());

    auto logger = spdlog::get("pdict");
    if (!logger) {
        logger = spdlog::stdout_color_mt("pdict");
        logger->set_pattern(kPattern);
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_store_logger(std::string_view store_name) {
    const std::string name = "store:" + std::string(store_name);

    std::lock_guard lock(registry_mutex());

    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::default_logger_raw()->level());
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace pdict
