#include "database/sqlite_metadata_store.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <functional>
#include <stdexcept>

namespace
{
    const char *const SELECT_COLUMNS = R"(
        id, title, description, alt, category, storage_key, image_url, thumbnail_url, thumbnail_key,
        file_size, mime_type, width, height, is_active, priority, created_at, updated_at
    )";

    const char *const NOW_UTC = "strftime('%Y-%m-%dT%H:%M:%fZ', 'now')";

    std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    using Binder = std::function<int(sqlite3_stmt *, int)>;

    // Column assignments for the fields present in a patch, with matching binders
    struct PatchColumns
    {
        std::vector<std::string> columns;
        std::vector<Binder> binders;
    };

    Binder bindText(const std::string &value)
    {
        return [value](sqlite3_stmt *stmt, int index)
        { return sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT); };
    }

    Binder bindInt(int value)
    {
        return [value](sqlite3_stmt *stmt, int index)
        { return sqlite3_bind_int(stmt, index, value); };
    }

    PatchColumns patchColumns(const AssetPatch &patch)
    {
        PatchColumns pc;
        auto add = [&pc](const std::string &column, Binder binder)
        {
            pc.columns.push_back(column);
            pc.binders.push_back(std::move(binder));
        };
        if (patch.title)
            add("title", bindText(*patch.title));
        if (patch.description)
            add("description", bindText(*patch.description));
        if (patch.alt)
            add("alt", bindText(*patch.alt));
        if (patch.category)
            add("category", bindText(*patch.category));
        if (patch.priority)
            add("priority", bindInt(*patch.priority));
        if (patch.is_active)
            add("is_active", bindInt(*patch.is_active ? 1 : 0));
        return pc;
    }

    std::string joinAssignments(const PatchColumns &pc)
    {
        std::string sql;
        for (const auto &column : pc.columns)
            sql += column + " = ?, ";
        return sql + "updated_at = " + NOW_UTC;
    }

    std::string placeholders(size_t count)
    {
        std::string sql;
        for (size_t i = 0; i < count; ++i)
            sql += (i == 0 ? "?" : ", ?");
        return sql;
    }

    std::string filterClause(const AssetFilter &filter)
    {
        std::string sql = " WHERE is_active = 1";
        if (filter.category)
            sql += " AND category = ?";
        if (filter.featured_only)
            sql += " AND priority >= 50";
        return sql;
    }

    int bindFilter(sqlite3_stmt *stmt, const AssetFilter &filter, int index)
    {
        if (filter.category)
            sqlite3_bind_text(stmt, index++, filter.category->c_str(), -1, SQLITE_TRANSIENT);
        return index;
    }

    const char *orderClause(AssetSort sort)
    {
        switch (sort)
        {
        case AssetSort::OLDEST:
            return " ORDER BY created_at ASC, id ASC";
        case AssetSort::PRIORITY:
            return " ORDER BY priority DESC, created_at DESC, id DESC";
        case AssetSort::TITLE:
            return " ORDER BY title ASC, id ASC";
        case AssetSort::RECENT:
        default:
            return " ORDER BY created_at DESC, id DESC";
        }
    }
}

SqliteMetadataStore::SqliteMetadataStore(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    Logger::info("Opening metadata database: " + db_path);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        Logger::error("Failed to open database: " + msg);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database " + db_path + ": " + msg);
    }

    if (db_path != ":memory:")
    {
        rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    }
    sqlite3_busy_timeout(db_, 5000);

    initialize();
}

SqliteMetadataStore::~SqliteMetadataStore()
{
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
        Logger::debug("Metadata database closed: " + db_path_);
    }
}

void SqliteMetadataStore::initialize()
{
    const std::string table_sql = R"(
        CREATE TABLE IF NOT EXISTS image_assets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            title TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            alt TEXT NOT NULL,
            category TEXT NOT NULL DEFAULT 'general',
            storage_key TEXT NOT NULL,
            image_url TEXT NOT NULL,
            thumbnail_url TEXT NOT NULL DEFAULT '',
            thumbnail_key TEXT NOT NULL DEFAULT '',
            file_size INTEGER NOT NULL CHECK (file_size >= 0),
            mime_type TEXT NOT NULL,
            width INTEGER NOT NULL DEFAULT 0,
            height INTEGER NOT NULL DEFAULT 0,
            is_active INTEGER NOT NULL DEFAULT 1,
            priority INTEGER NOT NULL DEFAULT 0 CHECK (priority BETWEEN -100 AND 100),
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
    )";
    DBOpResult result = executeStatement(table_sql);
    if (!result.success)
        throw std::runtime_error("Failed to create image_assets table: " + result.error_message);

    // Match the listing paths: category filter + priority sort, and recency
    const char *index_sql[] = {
        "CREATE INDEX IF NOT EXISTS idx_assets_category ON image_assets(category, is_active, priority DESC)",
        "CREATE INDEX IF NOT EXISTS idx_assets_recent ON image_assets(is_active, created_at DESC)",
        "CREATE INDEX IF NOT EXISTS idx_assets_priority ON image_assets(priority DESC, created_at DESC)",
    };
    for (const char *sql : index_sql)
    {
        result = executeStatement(sql);
        if (!result.success)
            Logger::warn("Failed to create index: " + result.error_message);
    }
    Logger::debug("Metadata schema ready");
}

DBOpResult SqliteMetadataStore::executeStatement(const std::string &sql)
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error_msg = "SQL execution failed: " + std::string(err_msg ? err_msg : sqlite3_errmsg(db_));
        Logger::error(error_msg);
        sqlite3_free(err_msg);
        return DBOpResult(false, error_msg);
    }
    return DBOpResult(true);
}

bool SqliteMetadataStore::prepare(const std::string &sql, SqliteStatementRAII &stmt)
{
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.address(), nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    return true;
}

ImageAsset SqliteMetadataStore::rowToAsset(sqlite3_stmt *stmt)
{
    ImageAsset asset;
    asset.id = sqlite3_column_int64(stmt, 0);
    asset.title = columnText(stmt, 1);
    asset.description = columnText(stmt, 2);
    asset.alt = columnText(stmt, 3);
    asset.category = columnText(stmt, 4);
    asset.storage_key = columnText(stmt, 5);
    asset.image_url = columnText(stmt, 6);
    asset.thumbnail_url = columnText(stmt, 7);
    asset.thumbnail_key = columnText(stmt, 8);
    asset.file_size = sqlite3_column_int64(stmt, 9);
    asset.mime_type = columnText(stmt, 10);
    asset.width = sqlite3_column_int(stmt, 11);
    asset.height = sqlite3_column_int(stmt, 12);
    asset.is_active = sqlite3_column_int(stmt, 13) != 0;
    asset.priority = sqlite3_column_int(stmt, 14);
    asset.created_at = columnText(stmt, 15);
    asset.updated_at = columnText(stmt, 16);
    return asset;
}

std::pair<DBOpResult, ImageAsset> SqliteMetadataStore::create(const ImageAsset &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Logger::debug("Creating image asset for key: " + record.storage_key);

    if (record.storage_key.empty() || record.image_url.empty())
    {
        std::string msg = "Storage key and image URL are required";
        Logger::error(msg);
        return {DBOpResult(false, msg), record};
    }

    const std::string insert_sql = std::string(R"(
        INSERT INTO image_assets (title, description, alt, category, storage_key, image_url, thumbnail_url,
                                  thumbnail_key, file_size, mime_type, width, height, is_active, priority,
                                  created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, )") +
                                   NOW_UTC + ", " + NOW_UTC + ")";

    SqliteStatementRAII stmt;
    if (!prepare(insert_sql, stmt))
        return {DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))), record};

    sqlite3_bind_text(stmt.get(), 1, record.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, record.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, record.alt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, record.category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, record.storage_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 6, record.image_url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 7, record.thumbnail_url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 8, record.thumbnail_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 9, record.file_size);
    sqlite3_bind_text(stmt.get(), 10, record.mime_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 11, record.width);
    sqlite3_bind_int(stmt.get(), 12, record.height);
    sqlite3_bind_int(stmt.get(), 13, record.is_active ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 14, record.priority);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to insert image asset: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return {DBOpResult(false, msg), record};
    }

    int64_t id = sqlite3_last_insert_rowid(db_);
    auto stored = selectById(id, false);
    if (!stored)
    {
        std::string msg = "Inserted image asset " + std::to_string(id) + " could not be read back";
        Logger::error(msg);
        return {DBOpResult(false, msg), record};
    }
    Logger::debug("Image asset stored with id " + std::to_string(id));
    return {DBOpResult(true), *stored};
}

std::pair<DBOpResult, std::optional<ImageAsset>> SqliteMetadataStore::update(int64_t id, const AssetPatch &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Logger::debug("Updating image asset " + std::to_string(id));

    PatchColumns pc = patchColumns(patch);
    const std::string update_sql = "UPDATE image_assets SET " + joinAssignments(pc) + " WHERE id = ? AND is_active = 1";

    SqliteStatementRAII stmt;
    if (!prepare(update_sql, stmt))
        return {DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))), std::nullopt};

    int index = 1;
    for (const auto &binder : pc.binders)
        binder(stmt.get(), index++);
    sqlite3_bind_int64(stmt.get(), index, id);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to update image asset: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return {DBOpResult(false, msg), std::nullopt};
    }
    if (sqlite3_changes(db_) == 0)
    {
        Logger::debug("No active image asset with id " + std::to_string(id));
        return {DBOpResult(true), std::nullopt};
    }

    // Read back without the active filter: the patch may have deactivated the row
    return {DBOpResult(true), selectById(id, false)};
}

DBOpResult SqliteMetadataStore::remove(int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    SqliteStatementRAII stmt;
    if (!prepare("DELETE FROM image_assets WHERE id = ?", stmt))
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));

    sqlite3_bind_int64(stmt.get(), 1, id);
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to delete image asset: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    Logger::debug("Deleted image asset " + std::to_string(id) + " (" + std::to_string(sqlite3_changes(db_)) + " rows)");
    return DBOpResult(true);
}

std::optional<ImageAsset> SqliteMetadataStore::findActiveById(int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return selectById(id, true);
}

std::optional<ImageAsset> SqliteMetadataStore::findById(int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return selectById(id, false);
}

std::optional<ImageAsset> SqliteMetadataStore::selectById(int64_t id, bool active_only)
{
    std::string select_sql = std::string("SELECT ") + SELECT_COLUMNS + " FROM image_assets WHERE id = ?";
    if (active_only)
        select_sql += " AND is_active = 1";

    SqliteStatementRAII stmt;
    if (!prepare(select_sql, stmt))
        return std::nullopt;

    sqlite3_bind_int64(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        return std::nullopt;
    return rowToAsset(stmt.get());
}

std::vector<ImageAsset> SqliteMetadataStore::listActive(const AssetFilter &filter, AssetSort sort, int limit, int64_t offset)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ImageAsset> results;

    const std::string select_sql = std::string("SELECT ") + SELECT_COLUMNS + " FROM image_assets" +
                                   filterClause(filter) + orderClause(sort) + " LIMIT ? OFFSET ?";
    SqliteStatementRAII stmt;
    if (!prepare(select_sql, stmt))
        return results;

    int index = bindFilter(stmt.get(), filter, 1);
    sqlite3_bind_int(stmt.get(), index++, limit);
    sqlite3_bind_int64(stmt.get(), index, offset);

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        results.push_back(rowToAsset(stmt.get()));
    return results;
}

int64_t SqliteMetadataStore::countActive(const AssetFilter &filter)
{
    std::lock_guard<std::mutex> lock(mutex_);

    SqliteStatementRAII stmt;
    if (!prepare("SELECT COUNT(*) FROM image_assets" + filterClause(filter), stmt))
        return 0;

    bindFilter(stmt.get(), filter, 1);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        return 0;
    return sqlite3_column_int64(stmt.get(), 0);
}

std::vector<std::string> SqliteMetadataStore::activeCategories()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> categories;

    SqliteStatementRAII stmt;
    if (!prepare("SELECT DISTINCT category FROM image_assets WHERE is_active = 1 ORDER BY category ASC", stmt))
        return categories;

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        categories.push_back(columnText(stmt.get(), 0));
    return categories;
}

AssetCounts SqliteMetadataStore::counts()
{
    std::lock_guard<std::mutex> lock(mutex_);
    AssetCounts counts;

    {
        SqliteStatementRAII stmt;
        if (prepare(R"(
            SELECT COUNT(*),
                   COALESCE(SUM(CASE WHEN is_active = 1 THEN 1 ELSE 0 END), 0),
                   COALESCE(SUM(CASE WHEN is_active = 1 THEN file_size ELSE 0 END), 0)
            FROM image_assets
        )",
                    stmt) &&
            sqlite3_step(stmt.get()) == SQLITE_ROW)
        {
            counts.total = sqlite3_column_int64(stmt.get(), 0);
            counts.active = sqlite3_column_int64(stmt.get(), 1);
            counts.active_bytes = sqlite3_column_int64(stmt.get(), 2);
        }
    }

    SqliteStatementRAII stmt;
    if (!prepare(R"(
        SELECT category, COUNT(*) AS n FROM image_assets
        WHERE is_active = 1 GROUP BY category ORDER BY n DESC, category ASC
    )",
                 stmt))
        return counts;

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        counts.by_category.push_back(CategoryCount{columnText(stmt.get(), 0), sqlite3_column_int64(stmt.get(), 1)});
    return counts;
}

std::pair<DBOpResult, BulkUpdateResult> SqliteMetadataStore::bulkUpdate(const std::vector<int64_t> &ids, const AssetPatch &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    BulkUpdateResult outcome;

    if (ids.empty())
        return {DBOpResult(false, "Image IDs array is required"), outcome};

    const std::string id_list = placeholders(ids.size());
    {
        SqliteStatementRAII stmt;
        if (!prepare("SELECT COUNT(*) FROM image_assets WHERE is_active = 1 AND id IN (" + id_list + ")", stmt))
            return {DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))), outcome};
        for (size_t i = 0; i < ids.size(); ++i)
            sqlite3_bind_int64(stmt.get(), static_cast<int>(i + 1), ids[i]);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW)
            outcome.matched = sqlite3_column_int64(stmt.get(), 0);
    }

    PatchColumns pc = patchColumns(patch);
    if (pc.columns.empty() || outcome.matched == 0)
        return {DBOpResult(true), outcome};

    // Only rows where some patched column actually differs count as modified
    std::string differs;
    for (size_t i = 0; i < pc.columns.size(); ++i)
        differs += (i == 0 ? "" : " OR ") + pc.columns[i] + " IS NOT ?";

    const std::string update_sql = "UPDATE image_assets SET " + joinAssignments(pc) +
                                   " WHERE is_active = 1 AND id IN (" + id_list + ") AND (" + differs + ")";
    SqliteStatementRAII stmt;
    if (!prepare(update_sql, stmt))
        return {DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))), outcome};

    int index = 1;
    for (const auto &binder : pc.binders)
        binder(stmt.get(), index++);
    for (int64_t id : ids)
        sqlite3_bind_int64(stmt.get(), index++, id);
    for (const auto &binder : pc.binders)
        binder(stmt.get(), index++);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to bulk update image assets: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return {DBOpResult(false, msg), outcome};
    }
    outcome.modified = sqlite3_changes(db_);
    Logger::info(std::to_string(outcome.modified) + " images updated (" + std::to_string(outcome.matched) + " matched)");
    return {DBOpResult(true), outcome};
}

DBOpResult SqliteMetadataStore::clearAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return executeStatement("DELETE FROM image_assets");
}
