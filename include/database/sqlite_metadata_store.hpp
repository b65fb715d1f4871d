#pragma once

#include "database/metadata_store.hpp"
#include <mutex>
#include <string>
#include <sqlite3.h>

class SqliteStatementRAII;

/**
 * @brief SQLite-backed MetadataStore
 *
 * One connection guarded by a mutex; every public call is serialized.
 * The schema is created on open.
 */
class SqliteMetadataStore : public MetadataStore
{
public:
    /**
     * @brief Open (or create) the database and its tables
     * @param db_path File path, or ":memory:" for a private in-memory database
     * @throws std::runtime_error if the database cannot be opened or the schema cannot be created
     */
    explicit SqliteMetadataStore(const std::string &db_path);
    ~SqliteMetadataStore() override;

    SqliteMetadataStore(const SqliteMetadataStore &) = delete;
    SqliteMetadataStore &operator=(const SqliteMetadataStore &) = delete;

    std::pair<DBOpResult, ImageAsset> create(const ImageAsset &record) override;
    std::pair<DBOpResult, std::optional<ImageAsset>> update(int64_t id, const AssetPatch &patch) override;
    DBOpResult remove(int64_t id) override;

    std::optional<ImageAsset> findActiveById(int64_t id) override;
    std::optional<ImageAsset> findById(int64_t id) override;

    std::vector<ImageAsset> listActive(const AssetFilter &filter, AssetSort sort, int limit, int64_t offset) override;
    int64_t countActive(const AssetFilter &filter) override;
    std::vector<std::string> activeCategories() override;
    AssetCounts counts() override;

    std::pair<DBOpResult, BulkUpdateResult> bulkUpdate(const std::vector<int64_t> &ids, const AssetPatch &patch) override;

    /**
     * @brief Remove every record
     */
    DBOpResult clearAll();

    const std::string &path() const { return db_path_; }

private:
    void initialize();
    DBOpResult executeStatement(const std::string &sql);
    bool prepare(const std::string &sql, SqliteStatementRAII &stmt);
    std::optional<ImageAsset> selectById(int64_t id, bool active_only);
    static ImageAsset rowToAsset(sqlite3_stmt *stmt);

    sqlite3 *db_;
    std::string db_path_;
    std::mutex mutex_;
};
