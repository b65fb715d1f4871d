#include "core/asset_catalog.hpp"
#include "core/image_utils.hpp"
#include "core/ingest_errors.hpp"
#include "database/asset_rules.hpp"
#include "logging/logger.hpp"
#include <algorithm>

AssetCatalog::AssetCatalog(MetadataStore &metadata) : metadata_(metadata) {}

AssetSort AssetCatalog::parseSort(const std::string &sort)
{
    if (sort == "oldest")
        return AssetSort::OLDEST;
    if (sort == "priority")
        return AssetSort::PRIORITY;
    if (sort == "title")
        return AssetSort::TITLE;
    return AssetSort::RECENT;
}

AssetPage AssetCatalog::list(const AssetQuery &query)
{
    int page = std::max(1, query.page);
    int limit = std::min(MAX_LIMIT, std::max(1, query.limit));

    AssetFilter filter;
    if (!query.category.empty() && query.category != "all")
        filter.category = query.category;
    filter.featured_only = query.featured;

    AssetPage result;
    int64_t offset = static_cast<int64_t>(page - 1) * limit;
    result.items = metadata_.listActive(filter, parseSort(query.sort), limit, offset);

    result.pagination.current = page;
    result.pagination.limit = limit;
    result.pagination.total = metadata_.countActive(filter);
    result.pagination.total_pages = (result.pagination.total + limit - 1) / limit;
    result.pagination.count = static_cast<int64_t>(result.items.size());

    Logger::debug("Listed " + std::to_string(result.pagination.count) + " of " +
                  std::to_string(result.pagination.total) + " image assets (page " + std::to_string(page) + ")");
    return result;
}

std::optional<ImageAsset> AssetCatalog::get(int64_t id)
{
    return metadata_.findActiveById(id);
}

std::vector<std::string> AssetCatalog::categories()
{
    return metadata_.activeCategories();
}

GalleryStats AssetCatalog::stats()
{
    AssetCounts counts = metadata_.counts();

    GalleryStats stats;
    stats.total_images = counts.total;
    stats.active_images = counts.active;
    stats.category_breakdown = counts.by_category;
    stats.total_file_size = counts.active_bytes;
    stats.formatted_file_size = ImageUtils::formatFileSize(static_cast<uint64_t>(counts.active_bytes));
    return stats;
}

BulkUpdateResult AssetCatalog::bulkUpdate(const std::vector<int64_t> &ids, const AssetPatch &raw_patch)
{
    if (ids.empty())
        throw ValidationError({"Image IDs array is required"});

    AssetPatch patch = AssetRules::normalize(raw_patch);
    std::vector<std::string> reasons = AssetRules::check(patch);
    if (!reasons.empty())
        throw ValidationError(reasons);

    auto [result, outcome] = metadata_.bulkUpdate(ids, patch);
    if (!result.success)
    {
        Logger::error("Bulk update failed: " + result.error_message);
        throw PersistenceError(result.error_message, CompensationOutcome());
    }
    Logger::info(std::to_string(outcome.modified) + " images updated successfully");
    return outcome;
}
