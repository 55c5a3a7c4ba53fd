#include "bsonc/codec/registry.hpp"
#include "bsonc/core/error.hpp"
#include "bsonc/core/log.hpp"

#include "test_main.hpp"

namespace {

using bsonc::core::LogLevel;
using bsonc::core::log_level;
using bsonc::core::set_log_level;

struct Unknown final {
    int v{0};
};

void test_log_level_roundtrip() {
    for (auto level : {LogLevel::trace,
                       LogLevel::debug,
                       LogLevel::info,
                       LogLevel::warn,
                       LogLevel::error,
                       LogLevel::critical,
                       LogLevel::off}) {
        set_log_level(level);
        TEST_EXPECT_EQ(log_level(), level);
    }
}

void test_level_names() {
    using bsonc::core::parse_log_level;
    using bsonc::core::to_string;

    TEST_EXPECT_EQ(to_string(LogLevel::warn), "warn");
    TEST_EXPECT_EQ(to_string(LogLevel::off), "off");

    LogLevel level = LogLevel::off;
    TEST_EXPECT_OK(parse_log_level("DEBUG", level));
    TEST_EXPECT_EQ(level, LogLevel::debug);
    TEST_EXPECT_OK(parse_log_level("warning", level));
    TEST_EXPECT_EQ(level, LogLevel::warn);
    TEST_EXPECT_OK(parse_log_level(to_string(LogLevel::critical), level));
    TEST_EXPECT_EQ(level, LogLevel::critical);

    TEST_EXPECT_ERR(parse_log_level("verbose", level),
                    bsonc::core::errc::invalid_argument);
    TEST_EXPECT_EQ(level, LogLevel::critical);
    TEST_EXPECT_ERR(parse_log_level("", level),
                    bsonc::core::errc::invalid_argument);
}

void test_debug_logging_on_lookup_miss() {
    // debug 级别下查找失败会写日志，但不影响返回的错误码。
    set_log_level(LogLevel::debug);

    bsonc::codec::Registry registry;
    TEST_EXPECT_OK(bsonc::codec::RegistryBuilder{}.build(registry));

    const bsonc::codec::ValueCodec *codec = nullptr;
    auto ec = registry.lookup<Unknown>(codec);
    TEST_EXPECT_ERR(ec, bsonc::codec::errc::unregistered_type);
    TEST_EXPECT(codec == nullptr);

    set_log_level(LogLevel::info);
    TEST_EXPECT_EQ(log_level(), LogLevel::info);
}

} // namespace

int main() {
    test_log_level_roundtrip();
    test_level_names();
    test_debug_logging_on_lookup_miss();
    return ::bsonc::tests::run_and_report();
}
