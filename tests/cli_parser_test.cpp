#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../imgsan_cli/src/cli/cli_parser.hpp"
#include "../libimgsan/include/error.hpp"
#include "../libimgsan/include/finding.hpp"
#include "../libimgsan/include/heuristic_registry.hpp"
#include <CLI/CLI.hpp>

using namespace imgsan;
using namespace imgsan::test;

class CliParserTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::filesystem::create_directories(dir / "photos");
        std::filesystem::create_directories(dir / "more");
        write_jpeg(dir / "single.jpg");
        setup_cli_parser(app, settings);
    }

    void parse(const std::string& args)
    {
        app.parse(args, false);
    }

    [[nodiscard]] std::string path(const std::string& rel) const
    {
        return (dir / rel).string();
    }

    TempDir dir;
    CLI::App app{"test"};
    Settings settings;
};

TEST_F(CliParserTest, OutputSelectsSanitizeMode)
{
    parse("-r -w 3 -o " + path("clean") + " " + path("photos") + " " + path("single.jpg"));
    const auto cfg = make_engine_config(settings);

    EXPECT_EQ(cfg.mode, RunMode::Sanitize);
    EXPECT_EQ(cfg.worker_count, 3);
    EXPECT_TRUE(cfg.recursive);
    EXPECT_EQ(cfg.source_root, dir / "photos");
    ASSERT_EQ(cfg.sources.size(), 1u);
    EXPECT_EQ(cfg.sources[0], dir / "single.jpg");
    EXPECT_EQ(cfg.destination_root, dir / "clean");
    EXPECT_EQ(cfg.enabled_heuristics, HeuristicRegistry{}.ids());
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(CliParserTest, WithoutOutputItIsAReport)
{
    parse("--no-heuristics --timeout-ms 250 " + path("photos"));
    const auto cfg = make_engine_config(settings);
    EXPECT_EQ(cfg.mode, RunMode::ReportOnly);
    EXPECT_TRUE(cfg.enabled_heuristics.empty());
    ASSERT_TRUE(cfg.file_timeout.has_value());
    EXPECT_EQ(cfg.file_timeout->count(), 250);
}

TEST_F(CliParserTest, KeepLowersCategorySensitivity)
{
    parse("--keep exif-timestamp --heuristic vendor_tags " + path("photos"));
    const auto cfg = make_engine_config(settings);
    EXPECT_EQ(cfg.rules.sensitivity_of(FindingCategory::ExifTimestamp), Sensitivity::Informational);
    EXPECT_EQ(cfg.rules.sensitivity_of(FindingCategory::ExifGps), Sensitivity::Sensitive);
    EXPECT_EQ(cfg.enabled_heuristics, (std::vector<std::string>{"vendor_tags"}));
}

TEST_F(CliParserTest, DigestOptions)
{
    parse("--digest-names --skip-existing --hash-sample-size 1MiB -o " + path("clean") + " " + path("photos"));
    const auto cfg = make_engine_config(settings);
    EXPECT_EQ(cfg.naming, OutputNaming::Digest);
    EXPECT_TRUE(cfg.skip_existing);
    ASSERT_TRUE(cfg.hash_sample_size.has_value());
    EXPECT_EQ(*cfg.hash_sample_size, 1024u * 1024u);
}

TEST_F(CliParserTest, BadSampleSizeIsAConfigError)
{
    parse("--digest-names --hash-sample-size lots -o " + path("clean") + " " + path("photos"));
    EXPECT_THROW((void)make_engine_config(settings), ConfigError);
}

TEST_F(CliParserTest, CrossValidation)
{
    EXPECT_THROW(parse("--mode sanitize " + path("photos")), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsTwoDirectories)
{
    EXPECT_THROW(parse(path("photos") + " " + path("more")), CLI::ValidationError);
}

TEST_F(CliParserTest, SkipExistingNeedsDigestNames)
{
    EXPECT_THROW(parse("--skip-existing -o " + path("clean") + " " + path("photos")), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsUnknownHeuristic)
{
    EXPECT_THROW(parse("--heuristic face_detector " + path("photos")), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsUnknownCategory)
{
    EXPECT_THROW(parse("--keep location " + path("photos")), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsMissingInput)
{
    EXPECT_THROW(parse(path("does_not_exist")), CLI::ValidationError);
}
