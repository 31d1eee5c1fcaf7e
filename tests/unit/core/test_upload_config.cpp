/**
 * @file test_upload_config.cpp
 * @brief Unit tests for upload configuration defaults and validation
 */

#include <gtest/gtest.h>

#include "pipedream/core/upload_config.h"

namespace pipedream::test {

// ============================================================================
// english_join Tests
// ============================================================================

TEST(EnglishJoinTest, EmptyList) {
    EXPECT_EQ(english_join({}), "");
}

TEST(EnglishJoinTest, SingleWord) {
    EXPECT_EQ(english_join({"bucket"}), "bucket");
}

TEST(EnglishJoinTest, TwoWordsHaveNoComma) {
    EXPECT_EQ(english_join({"accessKey", "bucket"}), "accessKey and bucket");
}

TEST(EnglishJoinTest, ThreeWordsUseOxfordComma) {
    EXPECT_EQ(english_join({"accessKey", "secretKey", "bucket"}),
              "accessKey, secretKey, and bucket");
}

TEST(EnglishJoinTest, OxfordCommaCanBeDisabled) {
    EXPECT_EQ(english_join({"a", "b", "c"}, false), "a, b and c");
}

// ============================================================================
// upload_config Tests
// ============================================================================

class UploadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.access_key = "AKID";
        config_.secret_key = "secret";
        config_.bucket = "bucket";
    }

    upload_config config_;
};

TEST_F(UploadConfigTest, ApplyDefaultsFillsZeroValues) {
    config_.apply_defaults();

    EXPECT_EQ(config_.max_retries, 3);
    EXPECT_EQ(config_.max_part_size, 5u * 1024u * 1024u);
    EXPECT_EQ(config_.region, "us-east-1");
    EXPECT_EQ(config_.endpoint, "s3.us-east-1.amazonaws.com");
}

TEST_F(UploadConfigTest, ApplyDefaultsKeepsExplicitValues) {
    config_.max_retries = 7;
    config_.max_part_size = 8 * megabyte;
    config_.region = "eu-west-1";
    config_.endpoint = "nyc3.digitaloceanspaces.com";

    config_.apply_defaults();

    EXPECT_EQ(config_.max_retries, 7);
    EXPECT_EQ(config_.max_part_size, 8 * megabyte);
    EXPECT_EQ(config_.region, "eu-west-1");
    EXPECT_EQ(config_.endpoint, "nyc3.digitaloceanspaces.com");
}

TEST_F(UploadConfigTest, DefaultEndpointFollowsRegion) {
    config_.region = "ap-south-1";
    config_.apply_defaults();
    EXPECT_EQ(config_.endpoint, "s3.ap-south-1.amazonaws.com");
}

TEST_F(UploadConfigTest, CompleteConfigValidates) {
    config_.apply_defaults();
    EXPECT_TRUE(config_.validate().has_value());
}

TEST_F(UploadConfigTest, MissingFieldsInFixedOrder) {
    upload_config empty;
    auto missing = empty.missing_fields();

    ASSERT_EQ(missing.size(), 3u);
    EXPECT_EQ(missing[0], "accessKey");
    EXPECT_EQ(missing[1], "secretKey");
    EXPECT_EQ(missing[2], "bucket");
}

TEST_F(UploadConfigTest, ValidateReportsMissingFields) {
    config_.access_key.clear();
    config_.bucket.clear();
    config_.apply_defaults();

    auto result = config_.validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
    EXPECT_EQ(result.error().message, "missing accessKey and bucket");
}

TEST_F(UploadConfigTest, NegativeRetriesAreInvalid) {
    config_.apply_defaults();
    config_.max_retries = -1;

    auto result = config_.validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(UploadConfigTest, ZeroPartSizeWithoutDefaultsIsInvalid) {
    config_.max_retries = 1;
    config_.endpoint = "localhost:9000";

    auto result = config_.validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(UploadConfigTest, EndpointHostStripsSchemeAndSlash) {
    config_.endpoint = "https://minio.local:9000/";
    EXPECT_EQ(config_.endpoint_host(), "minio.local:9000");
    EXPECT_EQ(config_.endpoint_url(), "https://minio.local:9000");
}

TEST_F(UploadConfigTest, EndpointUrlHonoursSsl) {
    config_.endpoint = "localhost:9000";
    config_.use_ssl = false;
    EXPECT_EQ(config_.endpoint_url(), "http://localhost:9000");

    config_.use_ssl = true;
    EXPECT_EQ(config_.endpoint_url(), "https://localhost:9000");
}

}  // namespace pipedream::test
