#include "core/asset_json.hpp"
#include "core/image_utils.hpp"
#include "database/asset_rules.hpp"

void to_json(nlohmann::json &j, const ImageAsset &asset)
{
    j = nlohmann::json{
        {"id", asset.id},
        {"title", asset.title},
        {"description", asset.description},
        {"alt", asset.alt},
        {"category", asset.category},
        {"imageUrl", asset.image_url},
        {"thumbnailUrl", asset.thumbnail_url},
        {"storageKey", asset.storage_key},
        {"thumbnailKey", asset.thumbnail_key},
        {"fileSize", asset.file_size},
        {"formattedFileSize", ImageUtils::formatFileSize(static_cast<uint64_t>(asset.file_size))},
        {"mimeType", asset.mime_type},
        {"width", asset.width},
        {"height", asset.height},
        {"isActive", asset.is_active},
        {"priority", asset.priority},
        {"isHighPriority", AssetRules::isHighPriority(asset)},
        {"createdAt", asset.created_at},
        {"updatedAt", asset.updated_at}};
}

void to_json(nlohmann::json &j, const Pagination &pagination)
{
    j = nlohmann::json{
        {"current", pagination.current},
        {"total", pagination.total_pages},
        {"limit", pagination.limit},
        {"count", pagination.count},
        {"totalRecords", pagination.total}};
}

void to_json(nlohmann::json &j, const AssetPage &page)
{
    j = nlohmann::json{{"images", page.items}, {"pagination", page.pagination}};
}

void to_json(nlohmann::json &j, const CategoryCount &count)
{
    j = nlohmann::json{{"_id", count.category}, {"count", count.count}};
}

void to_json(nlohmann::json &j, const GalleryStats &stats)
{
    j = nlohmann::json{
        {"totalImages", stats.total_images},
        {"activeImages", stats.active_images},
        {"categoryBreakdown", stats.category_breakdown},
        {"totalFileSize", stats.total_file_size},
        {"formattedFileSize", stats.formatted_file_size}};
}

void to_json(nlohmann::json &j, const BulkUpdateResult &result)
{
    j = nlohmann::json{{"matched", result.matched}, {"modified", result.modified}};
}

void to_json(nlohmann::json &j, const ImageMetadata &metadata)
{
    j = nlohmann::json{
        {"width", metadata.width},
        {"height", metadata.height},
        {"format", ImageFormats::getFormatName(metadata.format)},
        {"colorSpace", metadata.color_space},
        {"hasAlpha", metadata.has_alpha},
        {"size", metadata.size_bytes},
        {"aspectRatio", metadata.aspect_ratio}};
}

void to_json(nlohmann::json &j, const CompensationOutcome &outcome)
{
    j = nlohmann::json{
        {"attempted", outcome.attempted},
        {"succeeded", outcome.succeeded},
        {"keys", outcome.keys}};
    if (!outcome.error_message.empty())
        j["error"] = outcome.error_message;
}

nlohmann::json errorToJson(const IngestionError &error)
{
    nlohmann::json body = {{"success", false}, {"message", error.what()}};

    if (const auto *validation = dynamic_cast<const ValidationError *>(&error))
    {
        body["message"] = "Validation failed";
        body["errors"] = validation->reasons();
    }
    else if (const auto *persistence = dynamic_cast<const PersistenceError *>(&error))
    {
        body["cause"] = persistence->cause();
        if (persistence->compensation().attempted)
            body["compensation"] = persistence->compensation();
    }
    else if (const auto *storage = dynamic_cast<const StorageError *>(&error))
    {
        if (!storage->key().empty())
            body["key"] = storage->key();
        if (storage->compensation().attempted)
            body["compensation"] = storage->compensation();
    }
    return body;
}
