#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Persisted gallery image record
 *
 * storage_key and image_url are always written together. thumbnail_key is
 * empty when the thumbnail URL was derived from the primary URL rather
 * than uploaded.
 */
struct ImageAsset
{
    int64_t id = 0;
    std::string title;
    std::string description;
    std::string alt;
    std::string category = "general";
    std::string storage_key;
    std::string image_url;
    std::string thumbnail_url;
    std::string thumbnail_key;
    int64_t file_size = 0;
    std::string mime_type;
    int width = 0;
    int height = 0;
    bool is_active = true;
    int priority = 0;
    std::string created_at;
    std::string updated_at;
};

/**
 * @brief Partial update of the user-editable fields of an ImageAsset
 */
struct AssetPatch
{
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> alt;
    std::optional<std::string> category;
    std::optional<int> priority;
    std::optional<bool> is_active;

    bool empty() const
    {
        return !title && !description && !alt && !category && !priority && !is_active;
    }
};

enum class AssetSort
{
    RECENT,
    OLDEST,
    PRIORITY,
    TITLE
};

/**
 * @brief Row filter for catalog queries; only active records are ever listed
 */
struct AssetFilter
{
    std::optional<std::string> category;
    bool featured_only = false; // priority >= 50
};

struct CategoryCount
{
    std::string category;
    int64_t count = 0;
};

/**
 * @brief Raw aggregate counts over the asset table
 */
struct AssetCounts
{
    int64_t total = 0;
    int64_t active = 0;
    std::vector<CategoryCount> by_category; // active only, descending count
    int64_t active_bytes = 0;
};

struct BulkUpdateResult
{
    int64_t matched = 0;
    int64_t modified = 0;
};

/**
 * @brief Durable store for ImageAsset records
 *
 * Write operations report failure through DBOpResult. Lookups return
 * std::nullopt when no matching row exists.
 */
class MetadataStore
{
public:
    virtual ~MetadataStore() = default;

    /**
     * @brief Insert a new record
     * @return Result and the record as stored, with id and timestamps filled in
     */
    virtual std::pair<DBOpResult, ImageAsset> create(const ImageAsset &record) = 0;

    /**
     * @brief Apply a patch to an active record
     * @return Result and the updated record, or std::nullopt if no active record has this id
     */
    virtual std::pair<DBOpResult, std::optional<ImageAsset>> update(int64_t id, const AssetPatch &patch) = 0;

    /**
     * @brief Remove a record permanently; removing a missing id succeeds
     */
    virtual DBOpResult remove(int64_t id) = 0;

    virtual std::optional<ImageAsset> findActiveById(int64_t id) = 0;
    virtual std::optional<ImageAsset> findById(int64_t id) = 0;

    virtual std::vector<ImageAsset> listActive(const AssetFilter &filter, AssetSort sort, int limit, int64_t offset) = 0;
    virtual int64_t countActive(const AssetFilter &filter) = 0;
    virtual std::vector<std::string> activeCategories() = 0;
    virtual AssetCounts counts() = 0;

    /**
     * @brief Apply the same patch to every active record in ids
     */
    virtual std::pair<DBOpResult, BulkUpdateResult> bulkUpdate(const std::vector<int64_t> &ids, const AssetPatch &patch) = 0;
};
