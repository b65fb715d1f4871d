#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "database/metadata_store.hpp"

/**
 * @brief Listing request as a caller states it
 *
 * Out-of-range values are clamped rather than rejected: page to at least
 * 1, limit to [1, 100]. An unrecognised sort falls back to "recent".
 */
struct AssetQuery
{
    std::string category = "all"; // "all" disables the filter
    bool featured = false;
    std::string sort = "recent";   // recent | oldest | priority | title
    int page = 1;
    int limit = 20;
};

struct Pagination
{
    int current = 1;
    int64_t total_pages = 0;
    int limit = 20;
    int64_t count = 0; // items on this page
    int64_t total = 0; // matching records
};

struct AssetPage
{
    std::vector<ImageAsset> items;
    Pagination pagination;
};

struct GalleryStats
{
    int64_t total_images = 0;
    int64_t active_images = 0;
    std::vector<CategoryCount> category_breakdown;
    int64_t total_file_size = 0;
    std::string formatted_file_size;
};

/**
 * @brief Read-side queries and batch edits over active image assets
 */
class AssetCatalog
{
public:
    static constexpr int MAX_LIMIT = 100;

    explicit AssetCatalog(MetadataStore &metadata);

    AssetPage list(const AssetQuery &query);
    std::optional<ImageAsset> get(int64_t id);

    /**
     * @brief Distinct categories of active assets, sorted
     */
    std::vector<std::string> categories();

    GalleryStats stats();

    /**
     * @brief Apply one patch to many active assets
     * @throws ValidationError if ids is empty or the patch breaks a field rule
     * @throws PersistenceError if the store rejects the update
     */
    BulkUpdateResult bulkUpdate(const std::vector<int64_t> &ids, const AssetPatch &patch);

    static AssetSort parseSort(const std::string &sort);

private:
    MetadataStore &metadata_;
};
