#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include "wbind_env.hpp"

static const char* kVars[] = {
    "WBIND_MODE", "WBIND_LOG_LEVEL", "WBIND_LOG_FILE", "WBIND_HOST", "WBIND_ARENA_SIZE_MB",
    "WBIND_HEAP_LIMIT_MB", "WBIND_INITIAL_HEAP_MB", "WBIND_MIN_HEAP_MB", "WBIND_HEAP_GROWTH_PCT",
};

class EnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : kVars) unsetenv(v);
    }
};

TEST_F(EnvTest, Defaults) {
    WbindEnv env;
    EXPECT_EQ(env.get_mode(), WbindMode::TRACKED);
    EXPECT_EQ(env.get_log_level(), LogLevel::ERROR);
    EXPECT_TRUE(env.get_log_file().empty());
    EXPECT_EQ(env.get_host_kind(), WbindHostKind::MALLOC);
    EXPECT_EQ(env.get_arena_size(), 64u * 1024 * 1024);
    EXPECT_EQ(env.get_heap_limit(), 0u);
    EXPECT_EQ(env.get_initial_heap_size(), 0u);
    EXPECT_EQ(env.get_min_heap_size(), 0u);
    EXPECT_EQ(env.get_heap_growth_percent(), 0);
}

TEST_F(EnvTest, ReadsEveryVariable) {
    setenv("WBIND_MODE", "MONITOR", 1);
    setenv("WBIND_LOG_LEVEL", "DEBUG", 1);
    setenv("WBIND_LOG_FILE", "/tmp/wbind.log", 1);
    setenv("WBIND_HOST", "ARENA", 1);
    setenv("WBIND_ARENA_SIZE_MB", "8", 1);
    setenv("WBIND_HEAP_LIMIT_MB", "2", 1);
    setenv("WBIND_INITIAL_HEAP_MB", "4", 1);
    setenv("WBIND_MIN_HEAP_MB", "1", 1);
    setenv("WBIND_HEAP_GROWTH_PCT", "25", 1);

    WbindEnv env;
    EXPECT_EQ(env.get_mode(), WbindMode::MONITOR);
    EXPECT_EQ(env.get_log_level(), LogLevel::DEBUG);
    EXPECT_EQ(env.get_log_file(), "/tmp/wbind.log");
    EXPECT_EQ(env.get_host_kind(), WbindHostKind::ARENA);
    EXPECT_EQ(env.get_arena_size(), 8u * 1024 * 1024);
    EXPECT_EQ(env.get_heap_limit(), 2u * 1024 * 1024);
    EXPECT_EQ(env.get_initial_heap_size(), 4u * 1024 * 1024);
    EXPECT_EQ(env.get_min_heap_size(), 1u * 1024 * 1024);
    EXPECT_EQ(env.get_heap_growth_percent(), 25);
}

TEST_F(EnvTest, UnknownNamesFallBack) {
    setenv("WBIND_MODE", "VERBOSE", 1);
    setenv("WBIND_LOG_LEVEL", "TRACE", 1);
    setenv("WBIND_HOST", "POOL", 1);

    WbindEnv env;
    EXPECT_EQ(env.get_mode(), WbindMode::TRACKED);
    EXPECT_EQ(env.get_log_level(), LogLevel::ERROR);
    EXPECT_EQ(env.get_host_kind(), WbindHostKind::MALLOC);
}

TEST_F(EnvTest, MalformedNumberThrows) {
    setenv("WBIND_ARENA_SIZE_MB", "lots", 1);
    EXPECT_THROW(WbindEnv env, std::invalid_argument);
}

TEST_F(EnvTest, NegativeSizeIsRejected) {
    setenv("WBIND_HEAP_LIMIT_MB", "-1", 1);
    EXPECT_THROW(WbindEnv env, std::out_of_range);
}

TEST_F(EnvTest, SizeThatOverflowsBytesIsRejected) {
    setenv("WBIND_ARENA_SIZE_MB", "99999999999999999", 1);
    EXPECT_THROW(WbindEnv env, std::out_of_range);
}

TEST_F(EnvTest, GrowthPercentOutOfIntRangeIsRejected) {
    setenv("WBIND_HEAP_GROWTH_PCT", "-5", 1);
    EXPECT_THROW(WbindEnv env, std::out_of_range);

    setenv("WBIND_HEAP_GROWTH_PCT", "4294967296", 1);
    EXPECT_THROW(WbindEnv env, std::out_of_range);
}
