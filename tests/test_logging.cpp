#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "logging.hpp"

namespace cosmkit {
namespace {

using logging::Level;

struct Record {
    Level level;
    std::string logger;
    std::string message;
};

class CaptureHandler : public logging::Handler {
public:
    void emit(Level level, const std::string& logger_name, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back({level, logger_name, message});
    }

    std::vector<Record> records() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    std::mutex mutex_;
    std::vector<Record> records_;
};

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = &logging::get_logger(std::string("test.") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        logger_->clear_handlers();
        logger_->add_handler(capture_);
        logger_->set_level(Level::INFO);
    }

    logging::Logger* logger_ = nullptr;
    std::shared_ptr<CaptureHandler> capture_ = std::make_shared<CaptureHandler>();
};

TEST_F(LoggingTest, FormatsStreamedValues) {
    logger_->info << "sequence " << 42 << " for " << std::string("cosmos1abc");

    auto records = capture_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, Level::INFO);
    EXPECT_EQ(records[0].logger, logger_->name());
    EXPECT_EQ(records[0].message, "sequence 42 for cosmos1abc");
}

TEST_F(LoggingTest, DropsMessagesBelowLevel) {
    logger_->debug << "hidden";
    logger_->warning << "shown";
    logger_->set_level(Level::ERROR);
    logger_->warning << "hidden too";
    logger_->error << "failed";

    auto records = capture_->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "shown");
    EXPECT_EQ(records[1].level, Level::ERROR);
    EXPECT_FALSE(logger_->enabled(Level::WARNING));
}

TEST_F(LoggingTest, DirectLogHonorsLevel) {
    logger_->log(Level::DEBUG, "no");
    logger_->log(Level::INFO, "yes");
    ASSERT_EQ(capture_->records().size(), 1u);
    EXPECT_EQ(capture_->records()[0].message, "yes");
}

TEST_F(LoggingTest, SameNameSameLogger) {
    EXPECT_EQ(&logging::get_logger(logger_->name()), logger_);
    EXPECT_NE(&logging::get_logger(logger_->name() + ".other"), logger_);
}

TEST(LoggingLevelTest, Names) {
    EXPECT_EQ(logging::level_name(Level::DEBUG), "DEBUG");
    EXPECT_EQ(logging::level_name(Level::INFO), "INFO");
    EXPECT_EQ(logging::level_name(Level::WARNING), "WARNING");
    EXPECT_EQ(logging::level_name(Level::ERROR), "ERROR");
}

TEST(LoggingLevelTest, DefaultLevelAppliesToNewLoggers) {
    logging::set_default_level(Level::WARNING);
    auto& logger = logging::get_logger("test.default_level.fresh");
    logging::set_default_level(Level::INFO);

    EXPECT_EQ(logger.level(), Level::WARNING);
    EXPECT_TRUE(logger.enabled(Level::ERROR));
    EXPECT_FALSE(logger.enabled(Level::INFO));
}

} // namespace
} // namespace cosmkit
