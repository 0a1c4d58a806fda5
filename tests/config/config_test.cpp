#include "sbridge/config/config.hpp"
#include "sbridge/core/platform.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace sbridge;

namespace {

fs::path write_config(const std::string& text) {
    static std::atomic<uint64_t> counter{0};
    const auto path = fs::temp_directory_path() /
                      ("sbridge_config_test_" + std::to_string(counter.fetch_add(1)) + ".json");
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    const auto config = config::default_config();

    EXPECT_EQ(config.link.device, default_serial_device());
    EXPECT_EQ(config.link.baud_rate, 2000000u);
    EXPECT_EQ(config.link.read_timeout.count(), 1000);
    EXPECT_EQ(config.transfer.chunk_size, 4096u);
    EXPECT_EQ(config.transfer.handshake_retries, 8u);
    EXPECT_EQ(config.transfer.handshake_backoff.count(), 150);
    EXPECT_EQ(config.transfer.chunk_retries, 5u);
    EXPECT_EQ(config.transfer.chunk_backoff.count(), 50);
    EXPECT_EQ(config.transfer.stall_timeout.count(), 30000);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config::validate(config).is_ok());
}

TEST(ConfigTest, OverlaysOnlyPresentKeys) {
    const json j = {
        {"link", {{"device", "/dev/ttyACM0"}, {"read_timeout_ms", 250}}},
        {"transfer", {{"chunk_size", 512}}},
        {"output_dir", "/tmp/inbox"},
        {"unknown_key", true}
    };

    auto config = config::config_from_json(j);
    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().link.device, "/dev/ttyACM0");
    EXPECT_EQ(config.value().link.read_timeout.count(), 250);
    EXPECT_EQ(config.value().link.baud_rate, 2000000u);
    EXPECT_EQ(config.value().transfer.chunk_size, 512u);
    EXPECT_EQ(config.value().transfer.chunk_retries, 5u);
    EXPECT_EQ(config.value().output_dir.string(), "/tmp/inbox");
}

TEST(ConfigTest, WrongValueTypeIsConfigError) {
    const json j = {{"link", {{"baud_rate", "fast"}}}};
    auto config = config::config_from_json(j);
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigError);

    EXPECT_TRUE(config::config_from_json(json::array()).is_error());
}

TEST(ConfigTest, NegativeCountsAreRejectedInsteadOfWrapping) {
    auto retries = config::config_from_json(json{{"transfer", {{"handshake_retries", -1}}}});
    ASSERT_TRUE(retries.is_error());
    EXPECT_EQ(retries.error().code, ErrorCode::ConfigError);

    auto chunk = config::config_from_json(json{{"transfer", {{"chunk_size", -4096}}}});
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ErrorCode::ConfigError);

    auto baud = config::config_from_json(json{{"link", {{"baud_rate", -115200}}}});
    ASSERT_TRUE(baud.is_error());
    EXPECT_EQ(baud.error().code, ErrorCode::ConfigError);

    auto too_wide = config::config_from_json(json{{"link", {{"baud_rate", 5000000000LL}}}});
    ASSERT_TRUE(too_wide.is_error());
    EXPECT_EQ(too_wide.error().code, ErrorCode::ConfigError);

    auto fractional = config::config_from_json(json{{"transfer", {{"chunk_retries", 2.5}}}});
    ASSERT_TRUE(fractional.is_error());
    EXPECT_EQ(fractional.error().code, ErrorCode::ConfigError);
}

TEST(ConfigTest, ValidateRejectsOutOfRangeValues) {
    auto config = config::default_config();
    config.transfer.chunk_size = 70000;
    EXPECT_TRUE(config::validate(config).is_error());

    config = config::default_config();
    config.transfer.chunk_size = 0;
    EXPECT_TRUE(config::validate(config).is_error());

    config = config::default_config();
    config.transfer.handshake_retries = 0;
    EXPECT_TRUE(config::validate(config).is_error());

    config = config::default_config();
    config.link.baud_rate = 0;
    EXPECT_TRUE(config::validate(config).is_error());

    config = config::default_config();
    config.link.device.clear();
    EXPECT_TRUE(config::validate(config).is_error());

    config = config::default_config();
    config.log_level = "chatty";
    auto invalid_level = config::validate(config);
    ASSERT_TRUE(invalid_level.is_error());
    EXPECT_EQ(invalid_level.error().code, ErrorCode::ConfigError);

    config.log_level = "off";
    EXPECT_TRUE(config::validate(config).is_ok());
}

TEST(ConfigTest, LoadsAndValidatesFile) {
    const auto path = write_config(R"({
        "link": { "device": "COM7", "baud_rate": 115200 },
        "transfer": { "handshake_retries": 3, "stall_timeout_ms": 5000 },
        "log_level": "debug"
    })");

    auto config = config::load_config(path);
    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().link.device, "COM7");
    EXPECT_EQ(config.value().link.baud_rate, 115200u);
    EXPECT_EQ(config.value().transfer.handshake_retries, 3u);
    EXPECT_EQ(config.value().transfer.stall_timeout.count(), 5000);
    EXPECT_EQ(config.value().log_level, "debug");
}

TEST(ConfigTest, LoadReportsMissingInvalidAndOutOfRangeFiles) {
    auto missing = config::load_config(fs::temp_directory_path() / "sbridge_no_such_config.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::ConfigError);

    auto malformed = config::load_config(write_config("{ not json"));
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error().code, ErrorCode::ConfigError);

    auto out_of_range = config::load_config(write_config(R"({"transfer": {"chunk_size": 100000}})"));
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::ConfigError);
}

TEST(ConfigTest, JsonExportRoundTripsThroughOverlay) {
    auto config = config::default_config();
    config.link.device = "/dev/ttyS1";
    config.transfer.chunk_backoff = std::chrono::milliseconds(75);

    auto reloaded = config::config_from_json(config::config_to_json(config));
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().link.device, "/dev/ttyS1");
    EXPECT_EQ(reloaded.value().transfer.chunk_backoff.count(), 75);
}
