#include "core/asset_json.hpp"
#include <gtest/gtest.h>

TEST(AssetJsonTest, ImageAssetUsesCamelCase)
{
    ImageAsset asset;
    asset.id = 7;
    asset.title = "Lanterns";
    asset.alt = "Paper lanterns";
    asset.category = "events";
    asset.storage_key = "events/1-abc.jpg";
    asset.image_url = "https://cdn.example.com/events/1-abc.jpg";
    asset.thumbnail_key = "events/thumbnails/1-abc.jpg";
    asset.thumbnail_url = "https://cdn.example.com/events/thumbnails/1-abc.jpg";
    asset.file_size = 1536;
    asset.mime_type = "image/jpeg";
    asset.width = 1200;
    asset.height = 800;
    asset.priority = 75;
    asset.created_at = "2024-05-01T10:00:00.000Z";
    asset.updated_at = "2024-05-02T10:00:00.000Z";

    nlohmann::json j = asset;

    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["imageUrl"], asset.image_url);
    EXPECT_EQ(j["thumbnailUrl"], asset.thumbnail_url);
    EXPECT_EQ(j["storageKey"], asset.storage_key);
    EXPECT_EQ(j["fileSize"], 1536);
    EXPECT_EQ(j["formattedFileSize"], "1.5 KB");
    EXPECT_EQ(j["mimeType"], "image/jpeg");
    EXPECT_EQ(j["isActive"], true);
    EXPECT_EQ(j["isHighPriority"], true);
    EXPECT_EQ(j["createdAt"], asset.created_at);
    EXPECT_FALSE(j.contains("image_url"));
}

TEST(AssetJsonTest, PageWrapsImagesAndPagination)
{
    AssetPage page;
    page.items.resize(2);
    page.pagination.current = 2;
    page.pagination.total_pages = 5;
    page.pagination.limit = 2;
    page.pagination.count = 2;
    page.pagination.total = 9;

    nlohmann::json j = page;

    ASSERT_TRUE(j["images"].is_array());
    EXPECT_EQ(j["images"].size(), 2u);
    EXPECT_EQ(j["pagination"]["current"], 2);
    EXPECT_EQ(j["pagination"]["total"], 5);
    EXPECT_EQ(j["pagination"]["totalRecords"], 9);
}

TEST(AssetJsonTest, Stats)
{
    GalleryStats stats;
    stats.total_images = 4;
    stats.active_images = 3;
    stats.category_breakdown = {CategoryCount{"events", 2}, CategoryCount{"artwork", 1}};
    stats.total_file_size = 2048;
    stats.formatted_file_size = "2 KB";

    nlohmann::json j = stats;

    EXPECT_EQ(j["totalImages"], 4);
    EXPECT_EQ(j["activeImages"], 3);
    EXPECT_EQ(j["categoryBreakdown"][0]["_id"], "events");
    EXPECT_EQ(j["categoryBreakdown"][0]["count"], 2);
    EXPECT_EQ(j["formattedFileSize"], "2 KB");
}

TEST(AssetJsonTest, ValidationErrorBody)
{
    ValidationError error({"Image title is required", "Invalid category: x"});

    nlohmann::json body = errorToJson(error);

    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["message"], "Validation failed");
    EXPECT_EQ(body["errors"].size(), 2u);
    EXPECT_EQ(body["errors"][1], "Invalid category: x");
}

TEST(AssetJsonTest, PersistenceErrorBodyCarriesCompensation)
{
    CompensationOutcome outcome;
    outcome.attempted = true;
    outcome.succeeded = false;
    outcome.keys = {"general/1-a.jpg", "general/thumbnails/1-a.jpg"};
    outcome.error_message = "timeout";

    nlohmann::json body = errorToJson(PersistenceError("disk full", outcome));

    EXPECT_EQ(body["cause"], "disk full");
    EXPECT_EQ(body["compensation"]["attempted"], true);
    EXPECT_EQ(body["compensation"]["succeeded"], false);
    EXPECT_EQ(body["compensation"]["keys"].size(), 2u);
    EXPECT_EQ(body["compensation"]["error"], "timeout");
}

TEST(AssetJsonTest, PersistenceErrorWithoutCompensation)
{
    nlohmann::json body = errorToJson(PersistenceError("locked", CompensationOutcome()));
    EXPECT_FALSE(body.contains("compensation"));
}

TEST(AssetJsonTest, OtherErrors)
{
    nlohmann::json storage = errorToJson(StorageError("Failed to upload file to storage: boom", "general/a.jpg"));
    EXPECT_EQ(storage["key"], "general/a.jpg");
    EXPECT_EQ(storage["message"], "Failed to upload file to storage: boom");

    EXPECT_FALSE(storage.contains("compensation"));

    CompensationOutcome outcome;
    outcome.attempted = true;
    outcome.succeeded = false;
    outcome.keys = {"general/1-a.jpg"};
    outcome.error_message = "timeout";
    nlohmann::json orphaned = errorToJson(StorageError("Failed to upload file to storage: boom",
                                                       "general/thumbnails/1-a.jpg", outcome));
    EXPECT_EQ(orphaned["compensation"]["succeeded"], false);
    EXPECT_EQ(orphaned["compensation"]["keys"][0], "general/1-a.jpg");

    nlohmann::json missing = errorToJson(NotFoundError(12));
    EXPECT_EQ(missing["message"], "Image asset not found: 12");
    EXPECT_FALSE(missing.contains("errors"));
}

TEST(AssetJsonTest, ImageMetadata)
{
    ImageMetadata metadata;
    metadata.width = 1600;
    metadata.height = 900;
    metadata.format = ImageFormat::WEBP;
    metadata.color_space = "srgb";
    metadata.has_alpha = true;
    metadata.size_bytes = 4321;
    metadata.aspect_ratio = 1.78;

    nlohmann::json j = metadata;

    EXPECT_EQ(j["format"], "webp");
    EXPECT_EQ(j["colorSpace"], "srgb");
    EXPECT_EQ(j["hasAlpha"], true);
    EXPECT_EQ(j["size"], 4321);
    EXPECT_DOUBLE_EQ(j["aspectRatio"].get<double>(), 1.78);
}
