/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <pipedream/core/logging.h>

#include <string>
#include <vector>

namespace pipedream::test {

// =============================================================================
// Upload Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContextToJson) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, BasicFieldsToJson) {
    upload_log_context ctx;
    ctx.upload_id = "abc-123";
    ctx.key = "backups/dump.rdb";
    ctx.part_number = 2;
    ctx.bytes = 1024;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"upload_id\":\"abc-123\""), std::string::npos);
    EXPECT_NE(json.find("\"key\":\"backups/dump.rdb\""), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":2"), std::string::npos);
    EXPECT_NE(json.find("\"bytes\":1024"), std::string::npos);
}

TEST_F(UploadLogContextTest, RetryFieldsToJson) {
    upload_log_context ctx;
    ctx.attempt = 2;
    ctx.max_attempts = 3;
    ctx.error_message = "connection \"reset\"";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"max_attempts\":3"), std::string::npos);
    EXPECT_NE(json.find("connection \\\"reset\\\""), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

TEST(StructuredLogEntryTest, MergesContextIntoEntry) {
    structured_log_entry entry;
    entry.timestamp = "2025-01-01T00:00:00.000Z";
    entry.level = log_level::warn;
    entry.category = std::string(log_category::part);
    entry.message = "Part upload failed, retrying";

    upload_log_context ctx;
    ctx.part_number = 3;
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"pipedream.part\""), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":3"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class PipedreamLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        previous_level_ = get_logger().get_level();
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(previous_level_);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_console_output(true);
    }

    log_level previous_level_ = log_level::info;
};

TEST_F(PipedreamLoggerTest, LevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(PipedreamLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);

    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(PipedreamLoggerTest, CallbackReceivesEnabledEntries) {
    std::vector<std::string> messages;
    get_logger().set_level(log_level::info);
    get_logger().set_callback(
        [&messages](log_level, std::string_view, std::string_view message,
                    const upload_log_context*) {
            messages.emplace_back(message);
        });

    PD_LOG_DEBUG(log_category::upload, "hidden");
    PD_LOG_INFO(log_category::upload, "shown");
    PD_LOG_ERROR(log_category::upload, "also shown");

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "shown");
    EXPECT_EQ(messages[1], "also shown");
}

TEST_F(PipedreamLoggerTest, CallbackReceivesContext) {
    std::string upload_id;
    get_logger().set_callback(
        [&upload_id](log_level, std::string_view, std::string_view,
                     const upload_log_context* ctx) {
            if (ctx) {
                upload_id = ctx->upload_id;
            }
        });

    upload_log_context ctx;
    ctx.upload_id = "u-9";
    PD_LOG_INFO_CTX(log_category::session, "Multipart upload completed", ctx);

    EXPECT_EQ(upload_id, "u-9");
}

TEST_F(PipedreamLoggerTest, OutputFormatCanBeSwitched) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    PD_LOG_INFO(log_category::backend, "json entry");
}

}  // namespace pipedream::test
