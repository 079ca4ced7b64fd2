#include "runmap/core/log-macros.h"
#include "runmap/core/logger.h"
#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

// Redirects both streams and restores the global level afterwards
class LoggerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        previous_level_ = Logger::get_level();
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::set_level(previous_level_);
        Logger::reset_streams();
    }

    void
    clear()
    {
        out_.str("");
        err_.str("");
    }

    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel previous_level_ = LogLevel::ERROR;
};

}  // namespace

TEST_F(LoggerTest, ParsesLevelNames)
{
    EXPECT_TRUE(Logger::set_level(std::string("debug")));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::set_level(std::string("WARN")));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
    EXPECT_TRUE(Logger::set_level(std::string("Warning")));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
    EXPECT_TRUE(Logger::set_level(std::string("none")));
    EXPECT_EQ(Logger::get_level(), LogLevel::NONE);
    EXPECT_TRUE(Logger::set_level(std::string("info")));
    EXPECT_EQ(Logger::get_level(), LogLevel::INFO);
}

TEST_F(LoggerTest, RejectsUnknownLevelNames)
{
    Logger::set_level(LogLevel::INFO);
    EXPECT_FALSE(Logger::set_level(std::string("verbose")));
    EXPECT_FALSE(Logger::set_level(std::string("")));
    EXPECT_EQ(Logger::get_level(), LogLevel::INFO);
}

TEST(LoggerLevels, ParseLevelWithoutChangingTheLevel)
{
    LogLevel before = Logger::get_level();
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parse_level("none"), LogLevel::NONE);
    EXPECT_FALSE(Logger::parse_level("inherit").has_value());
    EXPECT_FALSE(Logger::parse_level("debugging").has_value());
    EXPECT_EQ(Logger::get_level(), before);
}

TEST(LoggerLevels, LevelNames)
{
    EXPECT_STREQ(Logger::level_name(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(Logger::level_name(LogLevel::WARNING), "WARNING");
    EXPECT_STREQ(Logger::level_name(LogLevel::NONE), "NONE");
    for (auto level : {LogLevel::NONE,
                       LogLevel::ERROR,
                       LogLevel::WARNING,
                       LogLevel::INFO,
                       LogLevel::DEBUG})
    {
        EXPECT_EQ(Logger::parse_level(Logger::level_name(level)), level);
    }
}

TEST_F(LoggerTest, AnnouncesMoreVerboseLevels)
{
    Logger::set_level(LogLevel::ERROR);
    clear();
    Logger::set_level(LogLevel::WARNING);
    EXPECT_NE(out_.str().find("Log level set to WARNING"), std::string::npos);

    clear();
    Logger::set_level(LogLevel::ERROR);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, RoutesBySeverity)
{
    Logger::set_level(LogLevel::DEBUG);
    clear();

    Logger::log(LogLevel::ERROR, "bad ", 1);
    Logger::log(LogLevel::WARNING, "odd ", 2);
    Logger::log(LogLevel::INFO, "note ", 3);
    Logger::log(LogLevel::DEBUG, "detail ", 4);

    std::string errors = err_.str();
    std::string output = out_.str();
    EXPECT_NE(errors.find("[ERROR] bad 1"), std::string::npos);
    EXPECT_NE(errors.find("[WARN]  odd 2"), std::string::npos);
    EXPECT_NE(output.find("[INFO]  note 3"), std::string::npos);
    EXPECT_NE(output.find("[DEBUG] detail 4"), std::string::npos);
    EXPECT_EQ(errors.find("note"), std::string::npos);
    EXPECT_EQ(output.find("bad"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowTheCurrentLevel)
{
    Logger::set_level(LogLevel::WARNING);
    clear();

    LOGI("hidden");
    LOGD("hidden");
    LOGW("shown");
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("shown"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesErrors)
{
    Logger::set_level(LogLevel::NONE);
    clear();

    LOGE("never");
    EXPECT_TRUE(err_.str().empty());
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, PartitionInheritsGlobalLevel)
{
    LogPartition partition("test.inherit");
    Logger::set_level(LogLevel::WARNING);
    EXPECT_EQ(partition.level(), LogLevel::WARNING);
    EXPECT_TRUE(partition.should_log(LogLevel::WARNING));
    EXPECT_FALSE(partition.should_log(LogLevel::DEBUG));

    Logger::set_level(LogLevel::DEBUG);
    EXPECT_TRUE(partition.should_log(LogLevel::DEBUG));
}

TEST_F(LoggerTest, PartitionLevelOverridesGlobal)
{
    LogPartition verbose("test.verbose", LogLevel::DEBUG);
    LogPartition quiet("test.quiet", LogLevel::NONE);
    Logger::set_level(LogLevel::ERROR);
    clear();

    PLOGD(verbose, "visible ", 7);
    PLOGE(quiet, "invisible");

    EXPECT_NE(out_.str().find("[test.verbose] visible 7"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());

    quiet.set_level(LogLevel::INHERIT);
    PLOGE(quiet, "now visible");
    EXPECT_NE(err_.str().find("[test.quiet] now visible"), std::string::npos);
}

TEST_F(LoggerTest, MacrosAppendSourceLocation)
{
    Logger::set_level(LogLevel::ERROR);
    clear();

    LOGE("located");
    EXPECT_NE(err_.str().find("logger-gtest.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, ResetRestoresStandardStreams)
{
    Logger::set_level(LogLevel::ERROR);
    Logger::reset_streams();
    clear();

    Logger::log(LogLevel::ERROR, "to stderr");
    EXPECT_TRUE(err_.str().empty());
}
