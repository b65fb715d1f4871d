#include "database/asset_rules.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace
{
    AssetFields validFields()
    {
        AssetFields fields;
        fields.title = "Lantern festival";
        fields.description = "Evening procession";
        fields.alt = "Paper lanterns over the river";
        fields.category = "events";
        fields.priority = 10;
        return fields;
    }

    bool contains(const std::vector<std::string> &reasons, const std::string &reason)
    {
        return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
    }
}

TEST(AssetRulesTest, ValidFieldsPass)
{
    EXPECT_TRUE(AssetRules::check(validFields(), "image/jpeg").empty());
    EXPECT_TRUE(AssetRules::check(validFields(), "image/jpg").empty());
}

TEST(AssetRulesTest, NormalizeTrimsAndAppliesDefaults)
{
    AssetFields raw;
    raw.title = "  Title \n";
    raw.description = "\t";
    raw.alt = " alt ";

    AssetFields normalized = AssetRules::normalize(raw);

    EXPECT_EQ(normalized.title, "Title");
    EXPECT_EQ(normalized.description, "");
    EXPECT_EQ(normalized.alt, "alt");
    EXPECT_EQ(normalized.category, std::optional<std::string>("general"));
    EXPECT_EQ(normalized.priority, std::optional<int>(0));
}

TEST(AssetRulesTest, BlankCategoryBecomesGeneral)
{
    AssetFields raw = validFields();
    raw.category = "   ";
    EXPECT_EQ(*AssetRules::normalize(raw).category, "general");
}

TEST(AssetRulesTest, ReportsEveryViolation)
{
    AssetFields fields;
    fields.title = "   ";
    fields.description = std::string(1001, 'd');
    fields.alt = "";
    fields.category = "landscapes";
    fields.priority = 101;

    auto reasons = AssetRules::check(AssetRules::normalize(fields), "image/bmp");

    EXPECT_EQ(reasons.size(), 6u);
    EXPECT_TRUE(contains(reasons, "Image title is required"));
    EXPECT_TRUE(contains(reasons, "Description cannot exceed 1000 characters"));
    EXPECT_TRUE(contains(reasons, "Alt text is required for accessibility"));
    EXPECT_TRUE(contains(reasons, "Invalid category: landscapes"));
    EXPECT_TRUE(contains(reasons, "Priority cannot exceed 100"));
    EXPECT_TRUE(contains(reasons, "Invalid file type. Only JPEG, PNG, GIF, and WebP images are allowed."));
}

TEST(AssetRulesTest, LengthLimitsAreInclusive)
{
    AssetFields fields = validFields();
    fields.title = std::string(200, 't');
    fields.description = std::string(1000, 'd');
    fields.alt = std::string(300, 'a');
    EXPECT_TRUE(AssetRules::check(fields, "image/png").empty());

    fields.title += "t";
    fields.alt += "a";
    auto reasons = AssetRules::check(fields, "image/png");
    EXPECT_TRUE(contains(reasons, "Title cannot exceed 200 characters"));
    EXPECT_TRUE(contains(reasons, "Alt text cannot exceed 300 characters"));
}

TEST(AssetRulesTest, LengthLimitsCountCharactersNotBytes)
{
    // U+5973, three bytes in UTF-8
    const std::string woman = "\xE5\xA5\xB3";
    auto repeat = [](const std::string &unit, int times)
    {
        std::string out;
        for (int i = 0; i < times; ++i)
            out += unit;
        return out;
    };

    AssetFields fields = validFields();
    fields.title = repeat(woman, 200);
    fields.description = repeat(woman, 1000);
    fields.alt = repeat(woman, 300);
    EXPECT_TRUE(AssetRules::check(fields, "image/png").empty());

    fields.title += woman;
    fields.description += woman;
    fields.alt += woman;
    auto reasons = AssetRules::check(fields, "image/png");
    EXPECT_EQ(reasons.size(), 3u);
    EXPECT_TRUE(contains(reasons, "Title cannot exceed 200 characters"));
    EXPECT_TRUE(contains(reasons, "Description cannot exceed 1000 characters"));
    EXPECT_TRUE(contains(reasons, "Alt text cannot exceed 300 characters"));

    AssetPatch patch;
    patch.title = repeat(woman, 150);
    EXPECT_TRUE(AssetRules::check(patch).empty());
}

TEST(AssetRulesTest, CharacterCount)
{
    EXPECT_EQ(AssetRules::characterCount(""), 0u);
    EXPECT_EQ(AssetRules::characterCount("abc"), 3u);
    EXPECT_EQ(AssetRules::characterCount("caf\xC3\xA9"), 4u);
    EXPECT_EQ(AssetRules::characterCount("\xF0\x9F\x8F\xAE lantern"), 9u);
}

TEST(AssetRulesTest, PriorityBounds)
{
    AssetFields fields = validFields();
    fields.priority = -100;
    EXPECT_TRUE(AssetRules::check(fields, "image/png").empty());
    fields.priority = 100;
    EXPECT_TRUE(AssetRules::check(fields, "image/png").empty());
    fields.priority = -101;
    EXPECT_TRUE(contains(AssetRules::check(fields, "image/png"), "Priority cannot be less than -100"));
}

TEST(AssetRulesTest, AllowedMimeListIsConfigurable)
{
    EXPECT_FALSE(AssetRules::check(validFields(), "image/gif", {"image/jpeg"}).empty());
    EXPECT_TRUE(AssetRules::check(validFields(), "image/gif").empty());
}

TEST(AssetRulesTest, PatchChecksOnlyPresentFields)
{
    AssetPatch patch;
    EXPECT_TRUE(patch.empty());
    EXPECT_TRUE(AssetRules::check(patch).empty());

    patch.priority = 75;
    EXPECT_FALSE(patch.empty());
    EXPECT_TRUE(AssetRules::check(patch).empty());

    patch.title = "";
    patch.category = "nope";
    auto reasons = AssetRules::check(AssetRules::normalize(patch));
    EXPECT_EQ(reasons.size(), 2u);
    EXPECT_TRUE(contains(reasons, "Image title is required"));
    EXPECT_TRUE(contains(reasons, "Invalid category: nope"));
}

TEST(AssetRulesTest, PatchNormalizeTrims)
{
    AssetPatch patch;
    patch.alt = "  text ";
    patch.category = " artwork ";
    AssetPatch normalized = AssetRules::normalize(patch);
    EXPECT_EQ(*normalized.alt, "text");
    EXPECT_EQ(*normalized.category, "artwork");
    EXPECT_TRUE(AssetRules::check(normalized).empty());
}

TEST(AssetRulesTest, Categories)
{
    EXPECT_EQ(AssetRules::categories().size(), 7u);
    EXPECT_TRUE(AssetRules::isCategory("calligraphy"));
    EXPECT_FALSE(AssetRules::isCategory("Calligraphy"));
    EXPECT_FALSE(AssetRules::isCategory("all"));
}

TEST(AssetRulesTest, HighPriorityIsStrictlyAboveFeaturedThreshold)
{
    ImageAsset asset;
    asset.priority = 50;
    EXPECT_FALSE(AssetRules::isHighPriority(asset));
    asset.priority = 51;
    EXPECT_TRUE(AssetRules::isHighPriority(asset));
}
