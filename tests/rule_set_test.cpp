#include <gtest/gtest.h>
#include "../libimgsan/include/finding.hpp"
#include "../libimgsan/include/rule_set.hpp"

using namespace imgsan;

TEST(RuleSetTest, DefaultsClassifyCommonKeys)
{
    const auto rules = RuleSet::defaults();
    EXPECT_EQ(rules.categorize("Exif.GPSInfo.GPSLatitude"), FindingCategory::ExifGps);
    EXPECT_EQ(rules.categorize("Exif.Image.Make"), FindingCategory::ExifDevice);
    EXPECT_EQ(rules.categorize("Exif.Photo.BodySerialNumber"), FindingCategory::ExifDevice);
    EXPECT_EQ(rules.categorize("Exif.Photo.DateTimeOriginal"), FindingCategory::ExifTimestamp);
    EXPECT_EQ(rules.categorize("Exif.Thumbnail.JPEGInterchangeFormat"), FindingCategory::Thumbnail);
    EXPECT_EQ(rules.categorize("Png.Time"), FindingCategory::ExifTimestamp);
    EXPECT_EQ(rules.categorize("Exif.Image.Orientation"), FindingCategory::Custom);
    EXPECT_EQ(rules.categorize("Icc.Profile"), FindingCategory::Custom);
}

TEST(RuleSetTest, SensitivityFollowsTheCategory)
{
    const auto rules = RuleSet::defaults();
    EXPECT_TRUE(rules.classify("Exif.GPSInfo.GPSAltitude", "12/1").is_sensitive());
    EXPECT_TRUE(rules.classify("Exif.Image.Model", "X100V").is_sensitive());
    EXPECT_FALSE(rules.classify("Exif.Image.Orientation", "1").is_sensitive());

    const auto a = rules.classify("Exif.Image.Make", "Canon");
    const auto b = rules.classify("Exif.Image.Make", "Nikon");
    EXPECT_EQ(a.category(), b.category());
    EXPECT_EQ(a.sensitivity(), b.sensitivity());
}

TEST(RuleSetTest, ExactRulesWinOverPrefixes)
{
    auto rules = RuleSet::defaults();
    rules.add_exact("Exif.GPSInfo.GPSVersionID", FindingCategory::Custom);
    EXPECT_EQ(rules.categorize("Exif.GPSInfo.GPSVersionID"), FindingCategory::Custom);
    EXPECT_EQ(rules.categorize("Exif.GPSInfo.GPSLongitude"), FindingCategory::ExifGps);
}

TEST(RuleSetTest, LongestPrefixWins)
{
    RuleSet rules;
    rules.add_prefix("Xmp.", FindingCategory::Custom);
    rules.add_prefix("Xmp.exif.GPS", FindingCategory::ExifGps);
    EXPECT_EQ(rules.categorize("Xmp.exif.GPSLatitude"), FindingCategory::ExifGps);
    EXPECT_EQ(rules.categorize("Xmp.dc.creator"), FindingCategory::Custom);
}

TEST(RuleSetTest, SensitivityCanBeLowered)
{
    auto rules = RuleSet::defaults();
    rules.set_sensitivity(FindingCategory::ExifTimestamp, Sensitivity::Informational);
    EXPECT_FALSE(rules.classify("Exif.Image.DateTime", "2024:01:01 00:00:00").is_sensitive());
    EXPECT_TRUE(rules.classify("Exif.Image.Make", "Canon").is_sensitive());
}

TEST(RuleSetTest, EmptyRuleSetIsAllCustom)
{
    const RuleSet rules;
    const auto f = rules.classify("Exif.GPSInfo.GPSLatitude", "1/1");
    EXPECT_EQ(f.category(), FindingCategory::Custom);
    EXPECT_FALSE(f.is_sensitive());
}

TEST(FindingTest, CategoryNamesRoundTrip)
{
    for (const auto c : {FindingCategory::ExifGps, FindingCategory::ExifDevice, FindingCategory::ExifTimestamp,
                         FindingCategory::Thumbnail, FindingCategory::Custom}) {
        EXPECT_EQ(parse_category(to_string(c)), c);
    }
    EXPECT_EQ(parse_category("exif-gps"), FindingCategory::ExifGps);
    EXPECT_FALSE(parse_category("location").has_value());
}

TEST(FindingTest, SensitiveCountOfResult)
{
    const auto rules = RuleSet::defaults();
    FileResult r;
    r.findings.push_back(rules.classify("Exif.Image.Make", "Canon"));
    r.findings.push_back(rules.classify("Exif.Image.Orientation", "1"));
    r.findings.push_back(rules.classify("Exif.GPSInfo.GPSLatitude", "1/1"));
    EXPECT_EQ(r.sensitive_count(), 2u);
}
