#include "buildmap-test-helpers.h"
#include "runmap/buildmap/buildmap-errors.h"
#include "runmap/buildmap/record-loader.h"
#include <gtest/gtest.h>

using namespace runmap::buildmap;
using namespace buildmap_test;

class RecordLoaderTest : public ::testing::Test
{
protected:
    TempBuildsDir builds{"loader-test"};
    CountingConstructor counting;
};

TEST_F(RecordLoaderTest, LoadsMarkedDirectory)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 7);
    RecordLoader loader(counting.constructor());

    auto build = loader.retrieve(dir);
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->number(), 7);
    EXPECT_EQ(build->id(), "2020-01-01_00-00-00");
}

TEST_F(RecordLoaderTest, RunsPostLoadHookOnce)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    RecordLoader loader(counting.constructor());

    auto build = std::dynamic_pointer_cast<TestBuild>(loader.retrieve(dir));
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->on_load_calls(), 1);
}

TEST_F(RecordLoaderTest, MissingMarkerIsAHole)
{
    auto dir = builds.add_empty_dir("2020-01-02_00-00-00");
    RecordLoader loader(counting.constructor());

    ScopedLogCapture logs(LogLevel::WARNING);
    EXPECT_EQ(loader.retrieve(dir), nullptr);
    EXPECT_TRUE(logs.errors().empty());
    // The constructor is never asked
    EXPECT_EQ(counting.calls(), 0);
}

TEST_F(RecordLoaderTest, CustomMarkerName)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 3);
    LoadOptions options;
    options.marker_name = "result.json";
    RecordLoader loader(counting.constructor(), options);

    EXPECT_EQ(loader.retrieve(dir), nullptr);

    TempBuildsDir::write_file(dir / "result.json", "{}");
    auto build = loader.retrieve(dir);
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->number(), 3);
}

TEST_F(RecordLoaderTest, ConstructionFailureIsLoggedAndContained)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    counting.fail_on("2020-01-01_00-00-00");
    RecordLoader loader(counting.constructor());

    ScopedLogCapture logs(LogLevel::WARNING);
    BuildPtr build;
    EXPECT_NO_THROW(build = loader.retrieve(dir));

    EXPECT_EQ(build, nullptr);
    EXPECT_EQ(counting.calls(), 1);
    EXPECT_NE(logs.errors().find("[WARN]"), std::string::npos);
    EXPECT_NE(logs.errors().find(dir.string()), std::string::npos);
}

TEST_F(RecordLoaderTest, CorruptRecordIsAbsent)
{
    auto dir = builds.add_corrupt_build("2020-01-01_00-00-00");
    RecordLoader loader(counting.constructor());

    ScopedLogCapture logs(LogLevel::WARNING);
    EXPECT_EQ(loader.retrieve(dir), nullptr);
    EXPECT_NE(logs.errors().find("could not load"), std::string::npos);
}

TEST_F(RecordLoaderTest, ArbitraryExceptionsAreContained)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    RecordLoader loader([](const fs::path&) -> BuildPtr {
        throw std::runtime_error("disk on fire");
    });

    ScopedLogCapture logs(LogLevel::WARNING);
    EXPECT_EQ(loader.retrieve(dir), nullptr);
    EXPECT_NE(logs.errors().find("disk on fire"), std::string::npos);
}

TEST_F(RecordLoaderTest, NonStandardExceptionsAreContained)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    RecordLoader loader([](const fs::path&) -> BuildPtr { throw 42; });

    ScopedLogCapture logs(LogLevel::WARNING);
    BuildPtr build;
    EXPECT_NO_THROW(build = loader.retrieve(dir));
    EXPECT_EQ(build, nullptr);
    EXPECT_NE(logs.errors().find("unknown error"), std::string::npos);
    EXPECT_NE(logs.errors().find(dir.string()), std::string::npos);
}

TEST_F(RecordLoaderTest, FailingPostLoadHookIsContained)
{
    struct FailingBuild : TestBuild
    {
        using TestBuild::TestBuild;

        void
        on_load() override
        {
            throw "hook failed";
        }
    };

    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    RecordLoader loader([](const fs::path& d) -> BuildPtr {
        return std::make_shared<FailingBuild>(1, d.filename().string());
    });

    ScopedLogCapture logs(LogLevel::WARNING);
    EXPECT_EQ(loader.retrieve(dir), nullptr);
}

TEST_F(RecordLoaderTest, DecliningConstructorIsAbsent)
{
    auto dir = builds.add_build("2020-01-01_00-00-00", 1);
    RecordLoader loader([](const fs::path&) -> BuildPtr { return nullptr; });
    EXPECT_EQ(loader.retrieve(dir), nullptr);
}

TEST(RecordLoader, EmptyConstructorIsFatal)
{
    EXPECT_THROW(
        RecordLoader loader(BuildConstructor{}), NullConstructorError);
}
