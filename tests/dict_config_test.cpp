#include "common/dict_config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class DictConfigTest : public ::testing::Test {
protected:
    pdict::DictConfig parse() {
        auto argv = make_argv(args_);
        return pdict::parse_config(static_cast<int>(argv.size()), argv.data());
    }

    std::vector<std::string> args_{"pdict", "--path", "./data/dict"};
};

// ── Valid configuration ────────────────────────────────────────────────────────

TEST_F(DictConfigTest, ParsesDefaults) {
    auto cfg = parse();

    EXPECT_EQ(cfg.path,            "./data/dict");
    EXPECT_EQ(cfg.engine,          pdict::Engine::RocksDB);
    EXPECT_EQ(cfg.isolation,       pdict::Isolation::Serialized);
    EXPECT_EQ(cfg.compress_level,  6);
    EXPECT_EQ(cfg.lock_timeout_ms, 10'000u);
    EXPECT_FALSE(cfg.sync);
    EXPECT_EQ(cfg.log_level,       "info");
}

TEST_F(DictConfigTest, ParsesEveryOption) {
    args_.insert(args_.end(), {
        "--engine",          "memory",
        "--isolation",       "engine-native",
        "--compress-level",  "9",
        "--lock-timeout-ms", "0",
        "--sync",
        "--log-level",       "debug",
    });
    auto cfg = parse();

    EXPECT_EQ(cfg.engine,          pdict::Engine::Memory);
    EXPECT_EQ(cfg.isolation,       pdict::Isolation::EngineNative);
    EXPECT_EQ(cfg.compress_level,  9);
    EXPECT_EQ(cfg.lock_timeout_ms, 0u);
    EXPECT_TRUE(cfg.sync);
    EXPECT_EQ(cfg.log_level,       "debug");
}

TEST_F(DictConfigTest, ToOptionsCopiesEveryField) {
    args_.insert(args_.end(), {"--isolation", "engine-native", "--compress-level", "1",
                               "--lock-timeout-ms", "250", "--sync"});
    auto options = pdict::to_options(parse());

    EXPECT_EQ(options.engine,         pdict::Engine::RocksDB);
    EXPECT_EQ(options.isolation,      pdict::Isolation::EngineNative);
    EXPECT_EQ(options.compress_level, 1);
    EXPECT_EQ(options.lock_timeout,   std::chrono::milliseconds(250));
    EXPECT_TRUE(options.sync_writes);
}

TEST_F(DictConfigTest, ConfigFromReadsToolOwnedVariablesMap) {
    po::options_description desc("tool");
    pdict::add_options(desc);
    desc.add_options()("threads", po::value<int>()->default_value(1), "threads");

    args_.insert(args_.end(), {"--threads", "8", "--engine", "memory"});
    auto argv = make_argv(args_);

    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(), desc), vm);
    po::notify(vm);

    auto cfg = pdict::config_from(vm);
    EXPECT_EQ(cfg.engine, pdict::Engine::Memory);
    EXPECT_EQ(vm["threads"].as<int>(), 8);
}

// ── String helpers ─────────────────────────────────────────────────────────────

TEST(DictConfigNames, ParseEngineAndIsolation) {
    EXPECT_EQ(pdict::parse_engine("rocksdb"), pdict::Engine::RocksDB);
    EXPECT_EQ(pdict::parse_engine("memory"), pdict::Engine::Memory);
    EXPECT_EQ(pdict::parse_isolation("serialized"), pdict::Isolation::Serialized);
    EXPECT_EQ(pdict::parse_isolation("engine-native"), pdict::Isolation::EngineNative);

    EXPECT_THROW((void)pdict::parse_engine("sqlite"), std::runtime_error);
    EXPECT_THROW((void)pdict::parse_isolation("snapshot"), std::runtime_error);
}

// ── Invalid configuration ──────────────────────────────────────────────────────

TEST_F(DictConfigTest, RejectsCompressLevelOutOfRange) {
    args_.insert(args_.end(), {"--compress-level", "10"});
    EXPECT_THROW((void)parse(), std::runtime_error);
}

TEST_F(DictConfigTest, RejectsUnknownEngine) {
    args_.insert(args_.end(), {"--engine", "lmdb"});
    EXPECT_THROW((void)parse(), std::runtime_error);
}

TEST_F(DictConfigTest, RejectsEmptyPathForRocksDB) {
    args_ = {"pdict", "--path", ""};
    EXPECT_THROW((void)parse(), std::runtime_error);
}

TEST_F(DictConfigTest, AllowsEmptyPathForMemory) {
    args_ = {"pdict", "--path", "", "--engine", "memory"};
    EXPECT_NO_THROW((void)parse());
}

TEST_F(DictConfigTest, RejectsUnknownOption) {
    args_.insert(args_.end(), {"--no-such-flag"});
    EXPECT_THROW((void)parse(), std::runtime_error);
}

TEST_F(DictConfigTest, RejectsNonNumericLockTimeout) {
    args_.insert(args_.end(), {"--lock-timeout-ms", "soon"});
    EXPECT_THROW((void)parse(), std::runtime_error);
}

TEST_F(DictConfigTest, HelpThrowsWithUsageText) {
    args_.insert(args_.end(), {"--help"});
    try {
        (void)parse();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--compress-level"), std::string::npos);
    }
}
