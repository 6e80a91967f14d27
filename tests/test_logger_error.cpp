/**
 * @file test_logger_error.cpp
 * @brief Tests for logging levels/sinks and the error model
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "voxgate/core/vg_error.h"
#include "voxgate/core/vg_logger.h"

namespace {

struct CapturedLog {
    vg_log_level_t level;
    std::string category;
    std::string message;
};

void capture_sink(vg_log_level_t level, const char* category, const char* message,
                  void* user_data) {
    auto* logs = static_cast<std::vector<CapturedLog>*>(user_data);
    logs->push_back({level, category, message});
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = vg_log_get_min_level();
        vg_log_set_callback(capture_sink, &logs_);
    }
    void TearDown() override {
        vg_log_set_callback(nullptr, nullptr);
        vg_log_set_min_level(previous_level_);
    }

    std::vector<CapturedLog> logs_;
    vg_log_level_t previous_level_ = VG_LOG_INFO;
};

}  // namespace

// =============================================================================
// LOGGING
// =============================================================================

TEST_F(LoggerTest, FormatsAndRoutesToCallback) {
    vg_log_set_min_level(VG_LOG_DEBUG);
    VG_LOG_INFO("SpeechQueue", "queued %d item(s) for %s", 3, "chat");

    ASSERT_EQ(logs_.size(), 1u);
    EXPECT_EQ(logs_[0].level, VG_LOG_INFO);
    EXPECT_EQ(logs_[0].category, "SpeechQueue");
    EXPECT_EQ(logs_[0].message, "queued 3 item(s) for chat");
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
    vg_log_set_min_level(VG_LOG_WARNING);
    VG_LOG_DEBUG("Test", "hidden");
    VG_LOG_INFO("Test", "hidden");
    VG_LOG_ERROR("Test", "shown");

    ASSERT_EQ(logs_.size(), 1u);
    EXPECT_EQ(logs_[0].message, "shown");
}

TEST_F(LoggerTest, LongMessagesAreNotTruncated) {
    vg_log_set_min_level(VG_LOG_DEBUG);
    std::string long_text(2000, 'x');
    VG_LOG_INFO("Test", "%s", long_text.c_str());

    ASSERT_EQ(logs_.size(), 1u);
    EXPECT_EQ(logs_[0].message.size(), 2000u);
}

TEST(LogLevel, ParsesNamesCaseInsensitively) {
    vg_log_level_t level = VG_LOG_INFO;
    EXPECT_TRUE(vg_log_parse_level("DEBUG", &level));
    EXPECT_EQ(level, VG_LOG_DEBUG);
    EXPECT_TRUE(vg_log_parse_level("warn", &level));
    EXPECT_EQ(level, VG_LOG_WARNING);
    EXPECT_FALSE(vg_log_parse_level("loud", &level));
    EXPECT_EQ(level, VG_LOG_WARNING);
}

// =============================================================================
// ERROR MODEL
// =============================================================================

TEST(ErrorModel, CategoryFollowsCodeRange) {
    EXPECT_STREQ(vg_error_category(VG_SUCCESS), "Success");
    EXPECT_STREQ(vg_error_category(VG_ERROR_NOT_CONFIGURED), "Configuration");
    EXPECT_STREQ(vg_error_category(VG_ERROR_RESOURCE_BUSY), "Lock");
    EXPECT_STREQ(vg_error_category(VG_ERROR_STALE_LOCK), "Lock");
    EXPECT_STREQ(vg_error_category(VG_ERROR_EXTERNAL_CALL), "External");
    EXPECT_STREQ(vg_error_category(VG_ERROR_IO), "Storage");
    EXPECT_STREQ(vg_error_category(VG_ERROR_PARSE), "Validation");
    EXPECT_STREQ(vg_error_category(-5), "Unknown");
}

TEST(ErrorModel, MakeErrorModelFillsAllFields) {
    vg_error_model_t model = vg_make_error_model(VG_ERROR_RESOURCE_BUSY);
    EXPECT_EQ(model.code, VG_ERROR_RESOURCE_BUSY);
    EXPECT_STREQ(model.category, "Lock");
    EXPECT_STRNE(model.message, "Unknown error");
}
