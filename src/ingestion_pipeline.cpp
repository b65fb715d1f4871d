#include "core/ingestion_pipeline.hpp"
#include "storage/storage_keys.hpp"
#include "logging/logger.hpp"

PipelineConfig PipelineConfig::fromConfig(const IngestConfig &config)
{
    PipelineConfig pipeline;
    pipeline.validation = config.validatorConfig();
    pipeline.allowed_mime_types = config.allowedMimeTypes();
    pipeline.primary = config.primaryOptions();
    pipeline.thumbnail_size = config.thumbnailSize();
    pipeline.thumbnail = config.thumbnailOptions();
    pipeline.thumbnail_strategy = config.thumbnailStrategy();
    pipeline.responsive_widths = config.responsiveWidths();
    pipeline.responsive = config.responsiveOptions();
    return pipeline;
}

IngestionPipeline::IngestionPipeline(ObjectStore &store, MetadataStore &metadata, PipelineConfig config)
    : store_(store), metadata_(metadata), config_(std::move(config)), validator_(config_.validation)
{
    Logger::info("Ingestion pipeline ready (storage: " + store_.name() + ")");
}

void IngestionPipeline::validate(const RawUpload &upload, const AssetFields &fields) const
{
    ValidationResult result = validator_.validate(upload.data);

    std::vector<std::string> reasons = result.reasons;
    for (auto &reason : AssetRules::check(fields, upload.mime_type, config_.allowed_mime_types))
        reasons.push_back(std::move(reason));

    if (!reasons.empty())
    {
        ValidationError error(reasons);
        Logger::warn("Rejected upload " + upload.filename + ": " + error.what());
        throw error;
    }

    if (result.metadata)
    {
        Logger::debug("Validated " + upload.filename + ": " + ImageFormats::getFormatName(result.metadata->format) + " " +
                      std::to_string(result.metadata->width) + "x" + std::to_string(result.metadata->height));
    }
}

ImageAsset IngestionPipeline::ingest(const RawUpload &upload, const AssetFields &declared)
{
    AssetFields fields = AssetRules::normalize(declared);
    const std::string category = fields.category.value_or("general");
    Logger::info("Ingesting " + upload.filename + " (" + std::to_string(upload.size()) + " bytes, category " + category + ")");

    // 1. Validate: nothing below runs on rejected input
    validate(upload, fields);

    // 2. Transform every variant before touching storage
    ProcessedVariant primary;
    ProcessedVariant thumbnail;
    try
    {
        primary = ImageTranscoder::transcode(upload.data, config_.primary);
        if (config_.thumbnail_strategy == ThumbnailStrategy::UPLOAD)
            thumbnail = ThumbnailGenerator::thumbnail(upload.data, config_.thumbnail_size, config_.thumbnail);
    }
    catch (const IngestionError &e)
    {
        Logger::error("Image processing failed for " + upload.filename + ": " + e.what());
        throw;
    }
    Logger::info("Transcoded primary to " + ImageFormats::getFormatName(primary.format) + " " +
                 std::to_string(primary.width) + "x" + std::to_string(primary.height) + " (" +
                 std::to_string(primary.size()) + " bytes)");

    // 3. Keys
    const std::string key = StorageKeys::generate(category, ImageFormats::getExtension(primary.format));

    // 4. Upload
    std::vector<std::string> uploaded;
    StoredObject stored;
    try
    {
        stored = store_.upload(key, primary.data, ImageFormats::getMimeType(primary.format));
    }
    catch (const StorageError &e)
    {
        Logger::error("Primary upload failed for " + key + ": " + e.what());
        throw;
    }
    catch (const std::exception &e)
    {
        Logger::error("Primary upload failed for " + key + ": " + e.what());
        throw StorageError(std::string("Failed to upload file to storage: ") + e.what(), key);
    }
    uploaded.push_back(stored.key);
    Logger::info("Uploaded primary to " + stored.url);

    std::string thumbnail_url;
    std::string thumbnail_key;
    if (config_.thumbnail_strategy == ThumbnailStrategy::UPLOAD)
    {
        thumbnail_key = StorageKeys::replaceExtension(StorageKeys::thumbnailKeyFor(key),
                                                      ImageFormats::getExtension(thumbnail.format));
        try
        {
            StoredObject thumb = store_.upload(thumbnail_key, thumbnail.data, ImageFormats::getMimeType(thumbnail.format));
            thumbnail_url = thumb.url;
            uploaded.push_back(thumb.key);
            Logger::info("Uploaded thumbnail to " + thumb.url);
        }
        catch (const std::exception &e)
        {
            Logger::error("Thumbnail upload failed for " + thumbnail_key + ": " + e.what());
            CompensationOutcome outcome = compensate(uploaded);
            const auto *storage = dynamic_cast<const StorageError *>(&e);
            std::string message = storage ? storage->what() : std::string("Failed to upload file to storage: ") + e.what();
            throw StorageError(message, thumbnail_key, outcome);
        }
    }
    else
    {
        thumbnail_url = StorageKeys::thumbnailUrlFor(stored.url);
    }

    // 5. Persist
    ImageAsset record;
    record.title = fields.title;
    record.description = fields.description;
    record.alt = fields.alt;
    record.category = category;
    record.storage_key = stored.key;
    record.image_url = stored.url;
    record.thumbnail_url = thumbnail_url;
    record.thumbnail_key = thumbnail_key;
    record.file_size = static_cast<int64_t>(primary.size());
    record.mime_type = ImageFormats::getMimeType(primary.format);
    record.width = primary.width;
    record.height = primary.height;
    record.is_active = true;
    record.priority = fields.priority.value_or(0);

    std::string cause;
    try
    {
        auto [result, asset] = metadata_.create(record);
        if (result.success)
        {
            Logger::info("Image asset " + std::to_string(asset.id) + " persisted for " + stored.key);
            return asset;
        }
        cause = result.error_message;
    }
    catch (const std::exception &e)
    {
        cause = e.what();
    }

    Logger::error("Failed to persist image asset for " + stored.key + ": " + cause);
    CompensationOutcome outcome = compensate(uploaded);
    throw PersistenceError(cause, outcome);
}

CompensationOutcome IngestionPipeline::compensate(const std::vector<std::string> &keys)
{
    CompensationOutcome outcome;
    outcome.attempted = !keys.empty();
    outcome.succeeded = true;
    outcome.keys = keys;

    for (const auto &key : keys)
    {
        try
        {
            store_.remove(key);
            Logger::info("Compensating delete removed " + key);
        }
        catch (const std::exception &e)
        {
            Logger::error("Compensating delete failed for " + key + ": " + e.what());
            if (outcome.succeeded)
                outcome.error_message = e.what();
            outcome.succeeded = false;
        }
    }
    return outcome;
}

ImageAsset IngestionPipeline::updateMetadata(int64_t id, const AssetPatch &raw_patch)
{
    AssetPatch patch = AssetRules::normalize(raw_patch);
    std::vector<std::string> reasons = AssetRules::check(patch);
    if (!reasons.empty())
    {
        ValidationError error(reasons);
        Logger::warn("Rejected update of image asset " + std::to_string(id) + ": " + error.what());
        throw error;
    }

    auto [result, asset] = metadata_.update(id, patch);
    if (!result.success)
    {
        Logger::error("Failed to update image asset " + std::to_string(id) + ": " + result.error_message);
        throw PersistenceError(result.error_message, CompensationOutcome());
    }
    if (!asset)
    {
        Logger::warn("Update of missing image asset " + std::to_string(id));
        throw NotFoundError(id);
    }

    Logger::info("Image asset " + std::to_string(id) + " updated");
    return *asset;
}

ImageAsset IngestionPipeline::deleteAsset(int64_t id, bool permanent)
{
    auto existing = metadata_.findActiveById(id);
    if (!existing)
    {
        Logger::warn("Delete of missing image asset " + std::to_string(id));
        throw NotFoundError(id);
    }

    if (!permanent)
    {
        AssetPatch deactivate;
        deactivate.is_active = false;
        auto [result, asset] = metadata_.update(id, deactivate);
        if (!result.success)
        {
            Logger::error("Failed to deactivate image asset " + std::to_string(id) + ": " + result.error_message);
            throw PersistenceError(result.error_message, CompensationOutcome());
        }
        if (!asset)
            throw NotFoundError(id);

        Logger::info("Image asset " + std::to_string(id) + " deactivated");
        return *asset;
    }

    std::vector<std::string> keys = {existing->storage_key};
    if (!existing->thumbnail_key.empty())
        keys.push_back(existing->thumbnail_key);
    for (const auto &key : keys)
    {
        try
        {
            store_.remove(key);
        }
        catch (const std::exception &e)
        {
            // The record goes regardless
            Logger::error("Error deleting " + key + " from storage: " + e.what());
        }
    }

    DBOpResult result = metadata_.remove(id);
    if (!result.success)
    {
        Logger::error("Failed to delete image asset " + std::to_string(id) + ": " + result.error_message);
        throw PersistenceError(result.error_message, CompensationOutcome());
    }

    Logger::info("Image asset " + std::to_string(id) + " permanently deleted");
    return *existing;
}
