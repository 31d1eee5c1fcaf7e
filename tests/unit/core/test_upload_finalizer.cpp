/**
 * @file test_upload_finalizer.cpp
 * @brief Unit tests for upload_finalizer completion and abort
 */

#include <gtest/gtest.h>

#include "fixtures/fake_multipart_backend.h"
#include "pipedream/core/logging.h"
#include "pipedream/core/upload_finalizer.h"

#include <optional>
#include <string>

namespace pipedream::test {

class UploadFinalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<fake_multipart_backend>();
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    void start_with_parts(int count) {
        ASSERT_TRUE(session_.begin(backend_->upload_id()).has_value());
        for (int i = 1; i <= count; ++i) {
            ASSERT_TRUE(session_.record_part({i, "\"etag-" + std::to_string(i) + "\"", 10})
                            .has_value());
        }
    }

    std::shared_ptr<fake_multipart_backend> backend_;
    multipart_session session_{"bucket", "key"};
};

TEST_F(UploadFinalizerTest, CompleteSendsPartsInOrder) {
    start_with_parts(3);
    ASSERT_TRUE(session_.transition_to(session_state::completing).has_value());
    upload_finalizer finalizer(backend_);

    auto result = finalizer.complete(session_);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().upload_id, backend_->upload_id());
    EXPECT_EQ(session_.state(), session_state::done);

    auto sent = backend_->completed_parts();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].part_number, 1);
    EXPECT_EQ(sent[2].part_number, 3);
}

TEST_F(UploadFinalizerTest, CompleteRequiresCompletingState) {
    start_with_parts(1);
    upload_finalizer finalizer(backend_);

    auto result = finalizer.complete(session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_state_transition);
    EXPECT_EQ(backend_->call_count("complete"), 0u);
}

TEST_F(UploadFinalizerTest, CompleteWithoutPartsFails) {
    start_with_parts(0);
    ASSERT_TRUE(session_.transition_to(session_state::completing).has_value());
    upload_finalizer finalizer(backend_);

    EXPECT_FALSE(finalizer.complete(session_).has_value());
    EXPECT_EQ(backend_->call_count("complete"), 0u);
    EXPECT_EQ(session_.state(), session_state::failed);
}

TEST_F(UploadFinalizerTest, BackendCompletionFailure) {
    start_with_parts(2);
    ASSERT_TRUE(session_.transition_to(session_state::completing).has_value());
    backend_->fail_complete();
    upload_finalizer finalizer(backend_);

    auto result = finalizer.complete(session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::completion_failed);
    EXPECT_NE(result.error().message.find("InvalidPart"), std::string::npos);
    EXPECT_EQ(session_.state(), session_state::failed);
}

TEST_F(UploadFinalizerTest, AbortActiveSession) {
    start_with_parts(1);
    upload_finalizer finalizer(backend_);

    auto result = finalizer.abort(session_);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(backend_->call_count("abort"), 1u);
    EXPECT_EQ(session_.state(), session_state::failed);
}

TEST_F(UploadFinalizerTest, AbortLogsStoredPartCountWithoutPartNumber) {
    start_with_parts(3);
    std::string message;
    std::optional<int> part_number = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view category, std::string_view text,
            const upload_log_context* context) {
            if (category == log_category::session && context) {
                message = std::string(text);
                part_number = context->part_number;
            }
        });

    upload_finalizer finalizer(backend_);
    ASSERT_TRUE(finalizer.abort(session_).has_value());
    get_logger().set_callback(nullptr);

    EXPECT_NE(message.find("3 parts stored"), std::string::npos);
    EXPECT_FALSE(part_number.has_value());
}

TEST_F(UploadFinalizerTest, AbortUninitiatedSessionSkipsBackend) {
    upload_finalizer finalizer(backend_);

    auto result = finalizer.abort(session_);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(backend_->calls().empty());
    EXPECT_EQ(session_.state(), session_state::failed);
}

TEST_F(UploadFinalizerTest, AbortFailureIsReported) {
    start_with_parts(1);
    backend_->fail_abort();
    upload_finalizer finalizer(backend_);

    auto result = finalizer.abort(session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::abort_failed);
    EXPECT_EQ(result.error().message, "abort refused");
    EXPECT_EQ(session_.state(), session_state::failed);
}

}  // namespace pipedream::test
