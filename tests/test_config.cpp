#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <cstdlib>

using namespace zkvm16;

/**
 * Test fixture that clears the configuration variables around each test
 */
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("ZKVM16_MEMORY_SIZE");
        unsetenv("ZKVM16_TRACE");
        unsetenv("ZKVM16_TRACE_CAPACITY");
    }

    static ErrorKind from_env_error() {
        try {
            RunConfig::from_env();
        } catch (const VmError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "from_env did not throw";
        return ErrorKind::Halted;
    }
};

TEST_F(ConfigTest, Defaults) {
    RunConfig config = RunConfig::from_env();
    EXPECT_EQ(config.memory_size, DEFAULT_MEMORY_SIZE);
    EXPECT_FALSE(config.trace_enabled);
    EXPECT_FALSE(config.trace_capacity.has_value());
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("ZKVM16_MEMORY_SIZE", "0x1000", 1);
    setenv("ZKVM16_TRACE", "true", 1);
    setenv("ZKVM16_TRACE_CAPACITY", "64", 1);

    RunConfig config = RunConfig::from_env();
    EXPECT_EQ(config.memory_size, 0x1000u);
    EXPECT_TRUE(config.trace_enabled);
    EXPECT_EQ(config.require_trace_capacity(), 64u);
}

TEST_F(ConfigTest, TraceFlagValues) {
    setenv("ZKVM16_TRACE", "1", 1);
    EXPECT_TRUE(RunConfig::from_env().trace_enabled);
    setenv("ZKVM16_TRACE", "0", 1);
    EXPECT_FALSE(RunConfig::from_env().trace_enabled);
}

TEST_F(ConfigTest, EnvFlagAcceptsOnlyOneAndTrue) {
    EXPECT_FALSE(debug::env_flag_enabled("ZKVM16_TRACE"));
    for (const char* on : {"1", "true"}) {
        setenv("ZKVM16_TRACE", on, 1);
        EXPECT_TRUE(debug::env_flag_enabled("ZKVM16_TRACE")) << on;
    }
    for (const char* off : {"0", "false", "TRUE", "yes", ""}) {
        setenv("ZKVM16_TRACE", off, 1);
        EXPECT_FALSE(debug::env_flag_enabled("ZKVM16_TRACE")) << off;
    }
}

/**
 * Test: Number syntax shared by the environment, the command line and
 * the assembler
 */
TEST_F(ConfigTest, ParseUnsigned) {
    EXPECT_EQ(parse_unsigned("0"), 0ull);
    EXPECT_EQ(parse_unsigned("42"), 42ull);
    EXPECT_EQ(parse_unsigned("0x1F"), 31ull);
    EXPECT_EQ(parse_unsigned("0XfF"), 255ull);
    EXPECT_EQ(parse_unsigned("18446744073709551615"), 18446744073709551615ull);

    for (const char* bad : {"", "0x", "-1", "+1", " 1", "1 ", "12kb", "0x1g", "1.5",
                            "18446744073709551616"}) {
        EXPECT_FALSE(parse_unsigned(bad).has_value()) << "'" << bad << "'";
    }
}

TEST_F(ConfigTest, MalformedMemorySize) {
    for (const char* bad : {"", "abc", "-5", "12kb", "0", "65537", "0x"}) {
        setenv("ZKVM16_MEMORY_SIZE", bad, 1);
        EXPECT_EQ(from_env_error(), ErrorKind::ConfigError) << "value '" << bad << "'";
    }
}

TEST_F(ConfigTest, LargestMemorySize) {
    setenv("ZKVM16_MEMORY_SIZE", "65536", 1);
    EXPECT_EQ(RunConfig::from_env().memory_size, MAX_MEMORY_SIZE);
}

TEST_F(ConfigTest, MalformedCapacity) {
    for (const char* bad : {"0", "ten", "99999999999999999999999"}) {
        setenv("ZKVM16_TRACE_CAPACITY", bad, 1);
        EXPECT_EQ(from_env_error(), ErrorKind::ConfigError) << "value '" << bad << "'";
    }
}

TEST_F(ConfigTest, MissingCapacity) {
    RunConfig config;
    try {
        config.require_trace_capacity();
        FAIL() << "expected ConfigError";
    } catch (const VmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
}

TEST_F(ConfigTest, ErrorMessageNamesSource) {
    try {
        RunConfig::parse_memory_size("huge", "--memory");
        FAIL() << "expected ConfigError";
    } catch (const VmError& e) {
        EXPECT_NE(std::string(e.what()).find("--memory"), std::string::npos);
        EXPECT_EQ(std::string(error_kind_name(e.kind())), "ConfigError");
    }
}
