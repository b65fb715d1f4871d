#include "core/ingestion_pipeline.hpp"
#include "storage/storage_keys.hpp"
#include "fakes.hpp"
#include "test_base.hpp"
#include <regex>

class IngestionPipelineTest : public ::testing::Test
{
protected:
    void SetUp() override { Logger::init("WARN"); }

    static RawUpload upload(std::vector<uint8_t> data, const std::string &mime = "image/jpeg")
    {
        RawUpload raw;
        raw.data = std::move(data);
        raw.mime_type = mime;
        raw.filename = "photo.jpg";
        return raw;
    }

    static AssetFields fields(const std::string &category = "workshop", int priority = 0)
    {
        AssetFields declared;
        declared.title = "Brush practice";
        declared.description = "Saturday class";
        declared.alt = "Hands holding a calligraphy brush";
        declared.category = category;
        declared.priority = priority;
        return declared;
    }

    MemoryObjectStore store_;
    FlakyMetadataStore metadata_;
};

TEST_F(IngestionPipelineTest, IngestStoresPrimaryThumbnailAndRecord)
{
    IngestionPipeline pipeline(store_, metadata_);

    ImageAsset asset = pipeline.ingest(upload(TestImages::png(800, 600)), fields("workshop", 60));

    EXPECT_GT(asset.id, 0);
    EXPECT_EQ(asset.title, "Brush practice");
    EXPECT_EQ(asset.category, "workshop");
    EXPECT_EQ(asset.priority, 60);
    EXPECT_TRUE(asset.is_active);
    EXPECT_TRUE(std::regex_match(asset.storage_key, std::regex("workshop/[0-9]+-[0-9a-z]{6}\\.jpg"))) << asset.storage_key;
    EXPECT_EQ(asset.image_url, store_.urlFor(asset.storage_key));
    EXPECT_EQ(asset.thumbnail_key, StorageKeys::thumbnailKeyFor(asset.storage_key));
    EXPECT_EQ(asset.thumbnail_url, store_.urlFor(asset.thumbnail_key));

    // Stored metadata describes the transcoded primary, not the upload
    EXPECT_EQ(asset.mime_type, "image/jpeg");
    EXPECT_EQ(asset.width, 800);
    EXPECT_EQ(asset.height, 600);
    ASSERT_EQ(store_.objects.count(asset.storage_key), 1u);
    EXPECT_EQ(asset.file_size, static_cast<int64_t>(store_.objects[asset.storage_key].size()));
    EXPECT_EQ(store_.content_types[asset.storage_key], "image/jpeg");

    ASSERT_EQ(store_.objects.count(asset.thumbnail_key), 1u);
    EXPECT_EQ(TestImages::decodedSize(store_.objects[asset.thumbnail_key]), cv::Size(400, 400));

    auto stored = metadata_.findActiveById(asset.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->storage_key, asset.storage_key);
}

TEST_F(IngestionPipelineTest, PrimaryIsBoundedByConfiguredBox)
{
    PipelineConfig config;
    config.primary.max_width = 1000;
    config.primary.max_height = 1000;
    IngestionPipeline pipeline(store_, metadata_, config);

    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(3000, 1500)), fields());

    EXPECT_EQ(asset.width, 1000);
    EXPECT_EQ(asset.height, 500);
}

TEST_F(IngestionPipelineTest, ConfiguredFormatsShapeKeysAndMime)
{
    PipelineConfig config;
    config.primary.format = ImageFormat::WEBP;
    config.thumbnail.format = ImageFormat::PNG;
    IngestionPipeline pipeline(store_, metadata_, config);

    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(300, 200)), fields());

    EXPECT_EQ(asset.mime_type, "image/webp");
    EXPECT_EQ(asset.storage_key.substr(asset.storage_key.size() - 5), ".webp");
    EXPECT_EQ(asset.thumbnail_key.substr(asset.thumbnail_key.size() - 4), ".png");
    EXPECT_EQ(store_.content_types[asset.thumbnail_key], "image/png");
}

TEST_F(IngestionPipelineTest, TwoIngestsGetDistinctKeysAndRecords)
{
    IngestionPipeline pipeline(store_, metadata_);
    auto data = TestImages::jpeg(200, 200);

    ImageAsset first = pipeline.ingest(upload(data), fields());
    ImageAsset second = pipeline.ingest(upload(data), fields());

    EXPECT_NE(first.id, second.id);
    EXPECT_NE(first.storage_key, second.storage_key);
    EXPECT_NE(first.thumbnail_key, second.thumbnail_key);
    EXPECT_EQ(store_.objects.size(), 4u);
    EXPECT_EQ(metadata_.counts().total, 2);
}

TEST_F(IngestionPipelineTest, ValidationCollectsImageAndFieldProblems)
{
    IngestionPipeline pipeline(store_, metadata_);
    AssetFields declared = fields("landscapes");
    declared.title = "  ";

    try
    {
        pipeline.ingest(upload(TestImages::garbage(), "image/bmp"), declared);
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        const auto &reasons = e.reasons();
        ASSERT_EQ(reasons.size(), 4u);
        EXPECT_EQ(reasons[0], "Invalid image file or corrupted data");
        EXPECT_NE(std::find(reasons.begin(), reasons.end(), "Image title is required"), reasons.end());
        EXPECT_NE(std::find(reasons.begin(), reasons.end(), "Invalid category: landscapes"), reasons.end());
    }

    EXPECT_EQ(store_.upload_calls, 0);
    EXPECT_EQ(metadata_.counts().total, 0);
}

TEST_F(IngestionPipelineTest, OversizedUploadIsRejectedBeforeStorage)
{
    PipelineConfig config;
    config.validation.max_width = 100;
    IngestionPipeline pipeline(store_, metadata_, config);

    EXPECT_THROW(pipeline.ingest(upload(TestImages::jpeg(101, 50)), fields()), ValidationError);
    EXPECT_EQ(store_.upload_calls, 0);
}

TEST_F(IngestionPipelineTest, PersistenceFailureRemovesUploadedObjects)
{
    IngestionPipeline pipeline(store_, metadata_);
    metadata_.fail_create = true;

    try
    {
        pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());
        FAIL() << "expected PersistenceError";
    }
    catch (const PersistenceError &e)
    {
        EXPECT_EQ(e.cause(), "database is locked");
        EXPECT_TRUE(e.compensation().attempted);
        EXPECT_TRUE(e.compensation().succeeded);
        EXPECT_EQ(e.compensation().keys, store_.uploaded_keys);
        EXPECT_TRUE(e.compensation().error_message.empty());
    }

    ASSERT_EQ(store_.uploaded_keys.size(), 2u);
    for (const auto &key : store_.uploaded_keys)
        EXPECT_FALSE(store_.exists(key)) << key;
    EXPECT_EQ(metadata_.counts().total, 0);
}

TEST_F(IngestionPipelineTest, ThrowingStoreIsTreatedAsPersistenceFailure)
{
    IngestionPipeline pipeline(store_, metadata_);
    metadata_.throw_on_create = true;

    try
    {
        pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());
        FAIL() << "expected PersistenceError";
    }
    catch (const PersistenceError &e)
    {
        EXPECT_EQ(e.cause(), "connection reset");
    }
    EXPECT_TRUE(store_.objects.empty());
}

TEST_F(IngestionPipelineTest, FailedCompensationIsReported)
{
    IngestionPipeline pipeline(store_, metadata_);
    metadata_.fail_create = true;
    store_.fail_removes = true;

    try
    {
        pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());
        FAIL() << "expected PersistenceError";
    }
    catch (const PersistenceError &e)
    {
        EXPECT_TRUE(e.compensation().attempted);
        EXPECT_FALSE(e.compensation().succeeded);
        EXPECT_NE(e.compensation().error_message.find("simulated outage"), std::string::npos);
    }
    // Every key was still tried
    EXPECT_EQ(store_.removed_keys.size(), 2u);
}

TEST_F(IngestionPipelineTest, PrimaryUploadFailureLeavesNothing)
{
    IngestionPipeline pipeline(store_, metadata_);
    store_.fail_upload_at = 1;

    EXPECT_THROW(pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields()), StorageError);
    EXPECT_TRUE(store_.objects.empty());
    EXPECT_TRUE(store_.removed_keys.empty());
    EXPECT_EQ(metadata_.counts().total, 0);
}

TEST_F(IngestionPipelineTest, ThumbnailUploadFailureRemovesPrimary)
{
    IngestionPipeline pipeline(store_, metadata_);
    store_.fail_upload_at = 2;

    EXPECT_THROW(pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields()), StorageError);
    ASSERT_EQ(store_.uploaded_keys.size(), 1u);
    EXPECT_EQ(store_.removed_keys, store_.uploaded_keys);
    EXPECT_TRUE(store_.objects.empty());
    EXPECT_EQ(metadata_.counts().total, 0);
}

TEST_F(IngestionPipelineTest, ThumbnailUploadFailureCarriesCompensation)
{
    IngestionPipeline pipeline(store_, metadata_);
    store_.fail_upload_at = 2;
    store_.fail_removes = true;

    try
    {
        pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());
        FAIL() << "expected StorageError";
    }
    catch (const StorageError &e)
    {
        EXPECT_NE(e.key().find("/thumbnails/"), std::string::npos);
        EXPECT_TRUE(e.compensation().attempted);
        EXPECT_FALSE(e.compensation().succeeded);
        EXPECT_EQ(e.compensation().keys, store_.uploaded_keys);
        EXPECT_NE(e.compensation().error_message.find("simulated outage"), std::string::npos);
    }
    // The primary is still in the store and the error says so
    EXPECT_EQ(store_.objects.size(), 1u);
    EXPECT_EQ(metadata_.counts().total, 0);
}

TEST_F(IngestionPipelineTest, UnexpectedThumbnailUploadErrorStillRemovesPrimary)
{
    IngestionPipeline pipeline(store_, metadata_);
    store_.fail_upload_at = 2;
    store_.foreign_errors = true;

    try
    {
        pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());
        FAIL() << "expected StorageError";
    }
    catch (const StorageError &e)
    {
        EXPECT_NE(std::string(e.what()).find("connection pool exhausted"), std::string::npos);
        EXPECT_TRUE(e.compensation().attempted);
        EXPECT_TRUE(e.compensation().succeeded);
    }
    EXPECT_EQ(store_.removed_keys, store_.uploaded_keys);
    EXPECT_TRUE(store_.objects.empty());
}

TEST_F(IngestionPipelineTest, UnexpectedPrimaryUploadErrorSurfacesAsStorageError)
{
    IngestionPipeline pipeline(store_, metadata_);
    store_.fail_upload_at = 1;
    store_.foreign_errors = true;

    EXPECT_THROW(pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields()), StorageError);
    EXPECT_TRUE(store_.objects.empty());
}

TEST_F(IngestionPipelineTest, PathSubstitutionUploadsOnlyThePrimary)
{
    PipelineConfig config;
    config.thumbnail_strategy = ThumbnailStrategy::PATH_SUBSTITUTION;
    IngestionPipeline pipeline(store_, metadata_, config);

    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(300, 300)), fields());

    EXPECT_EQ(store_.upload_calls, 1);
    EXPECT_TRUE(asset.thumbnail_key.empty());
    EXPECT_EQ(asset.thumbnail_url, "https://cdn.example.com/gallery/thumbnails/" + asset.storage_key);
}

TEST_F(IngestionPipelineTest, UpdateMetadataPatchesRecord)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());

    AssetPatch patch;
    patch.title = "  Renamed  ";
    patch.category = "events";
    ImageAsset updated = pipeline.updateMetadata(asset.id, patch);

    EXPECT_EQ(updated.title, "Renamed");
    EXPECT_EQ(updated.category, "events");
    EXPECT_EQ(updated.storage_key, asset.storage_key);
    EXPECT_EQ(store_.upload_calls, 2);
}

TEST_F(IngestionPipelineTest, UpdateMetadataErrors)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());

    AssetPatch bad;
    bad.priority = 500;
    EXPECT_THROW(pipeline.updateMetadata(asset.id, bad), ValidationError);

    AssetPatch good;
    good.priority = 5;
    EXPECT_THROW(pipeline.updateMetadata(asset.id + 100, good), NotFoundError);

    metadata_.fail_update = true;
    EXPECT_THROW(pipeline.updateMetadata(asset.id, good), PersistenceError);
}

TEST_F(IngestionPipelineTest, SoftDeleteKeepsObjects)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());

    ImageAsset deleted = pipeline.deleteAsset(asset.id);

    EXPECT_FALSE(deleted.is_active);
    EXPECT_TRUE(store_.exists(asset.storage_key));
    EXPECT_TRUE(store_.exists(asset.thumbnail_key));
    EXPECT_FALSE(metadata_.findActiveById(asset.id).has_value());
    EXPECT_TRUE(metadata_.findById(asset.id).has_value());

    EXPECT_THROW(pipeline.deleteAsset(asset.id), NotFoundError);
    EXPECT_THROW(pipeline.deleteAsset(asset.id, true), NotFoundError);
}

TEST_F(IngestionPipelineTest, PermanentDeleteRemovesObjectsAndRecord)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());

    ImageAsset deleted = pipeline.deleteAsset(asset.id, true);

    EXPECT_EQ(deleted.id, asset.id);
    EXPECT_TRUE(deleted.is_active);
    EXPECT_TRUE(store_.objects.empty());
    EXPECT_FALSE(metadata_.findById(asset.id).has_value());
}

TEST_F(IngestionPipelineTest, PermanentDeleteSurvivesStorageFailure)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());
    store_.fail_removes = true;

    EXPECT_NO_THROW(pipeline.deleteAsset(asset.id, true));
    EXPECT_EQ(store_.removed_keys.size(), 2u);
    EXPECT_FALSE(metadata_.findById(asset.id).has_value());
}

TEST_F(IngestionPipelineTest, PermanentDeleteSurvivesUnexpectedStorageError)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());
    store_.fail_removes = true;
    store_.foreign_errors = true;

    EXPECT_NO_THROW(pipeline.deleteAsset(asset.id, true));
    EXPECT_EQ(store_.removed_keys.size(), 2u);
    EXPECT_FALSE(metadata_.findById(asset.id).has_value());
}

TEST_F(IngestionPipelineTest, PermanentDeleteReportsDatabaseFailure)
{
    IngestionPipeline pipeline(store_, metadata_);
    ImageAsset asset = pipeline.ingest(upload(TestImages::jpeg(200, 200)), fields());
    metadata_.fail_remove = true;

    EXPECT_THROW(pipeline.deleteAsset(asset.id, true), PersistenceError);
    EXPECT_TRUE(metadata_.findActiveById(asset.id).has_value());
}

TEST(PipelineConfigTest, FromConfig)
{
    IngestConfig config;
    config.update({{"thumbnail", {{"size", "small"}, {"strategy", "path_substitution"}}},
                   {"validation", {{"mime_types", {{"image/gif", false}}}}}});

    PipelineConfig pipeline = PipelineConfig::fromConfig(config);

    EXPECT_EQ(pipeline.thumbnail_size.width, 150);
    EXPECT_EQ(pipeline.thumbnail_strategy, ThumbnailStrategy::PATH_SUBSTITUTION);
    EXPECT_EQ(pipeline.allowed_mime_types.size(), 4u);
    EXPECT_EQ(pipeline.primary.max_width, 2000);
}
