#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/engine_config.hpp"
#include "../libimgsan/include/error.hpp"

using namespace imgsan;
using namespace imgsan::test;

class EngineConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::filesystem::create_directories(dir / "in");
        config.source_root = dir / "in";
        config.destination_root = dir / "out";
        config.mode = RunMode::Sanitize;
    }

    TempDir dir;
    EngineConfig config;
};

TEST_F(EngineConfigTest, ValidConfigPasses)
{
    EXPECT_NO_THROW(config.validate());

    config.mode = RunMode::ReportOnly;
    config.destination_root.clear();
    EXPECT_NO_THROW(config.validate());
}

TEST_F(EngineConfigTest, RejectsBadWorkerCounts)
{
    config.worker_count = 0;
    EXPECT_THROW(config.validate(), ConfigError);
    config.worker_count = -3;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(EngineConfigTest, RequiresInput)
{
    config.source_root.clear();
    EXPECT_THROW(config.validate(), ConfigError);
    config.sources.push_back(dir / "in" / "a.jpg");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(EngineConfigTest, SanitizeNeedsADistinctDestination)
{
    config.destination_root.clear();
    EXPECT_THROW(config.validate(), ConfigError);

    config.destination_root = config.source_root;
    EXPECT_THROW(config.validate(), ConfigError);

    config.destination_root = dir / "in" / ".." / "in";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(EngineConfigTest, RejectsNonPositiveTimeout)
{
    config.file_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(config.validate(), ConfigError);
    config.file_timeout = std::chrono::milliseconds(250);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(EngineConfigTest, DigestOptionsNeedSanitizeAndDigestNaming)
{
    config.skip_existing = true;
    EXPECT_THROW(config.validate(), ConfigError);

    config.naming = OutputNaming::Digest;
    EXPECT_NO_THROW(config.validate());

    config.mode = RunMode::ReportOnly;
    EXPECT_THROW(config.validate(), ConfigError);

    config.mode = RunMode::Sanitize;
    config.hash_sample_size = 0;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(EngineConfigTest, RejectsInvalidRegex)
{
    config.include_patterns = {"[unclosed"};
    EXPECT_THROW(config.validate(), ConfigError);
    config.include_patterns = {R"(\.jpe?g$)"};
    config.exclude_patterns = {"(bad"};
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RunModeTest, Names)
{
    EXPECT_EQ(to_string(RunMode::Sanitize), "sanitize");
    EXPECT_EQ(to_string(RunMode::ReportOnly), "report");
}
