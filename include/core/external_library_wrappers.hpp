#pragma once
#include <magic.h>
#include <sqlite3.h>
#include <webp/encode.h>

// RAII wrapper for a libmagic cookie
class MagicCookieRAII
{
private:
    magic_t cookie_;

public:
    explicit MagicCookieRAII(int flags) : cookie_(magic_open(flags)) {}
    ~MagicCookieRAII()
    {
        if (cookie_)
            magic_close(cookie_);
    }

    magic_t get() { return cookie_; }
    bool valid() const { return cookie_ != nullptr; }

    // Disable copy
    MagicCookieRAII(const MagicCookieRAII &) = delete;
    MagicCookieRAII &operator=(const MagicCookieRAII &) = delete;

    // Allow move
    MagicCookieRAII(MagicCookieRAII &&other) noexcept : cookie_(other.cookie_)
    {
        other.cookie_ = nullptr;
    }
};

// RAII wrapper for libwebp WebPPicture
class WebPPictureRAII
{
private:
    WebPPicture picture_;
    bool initialized_;

public:
    WebPPictureRAII() : initialized_(WebPPictureInit(&picture_) != 0) {}
    ~WebPPictureRAII()
    {
        if (initialized_)
            WebPPictureFree(&picture_);
    }

    WebPPicture *get() { return &picture_; }
    bool valid() const { return initialized_; }

    // Disable copy and move, libwebp keeps pointers into the struct
    WebPPictureRAII(const WebPPictureRAII &) = delete;
    WebPPictureRAII &operator=(const WebPPictureRAII &) = delete;
};

// RAII wrapper for libwebp WebPMemoryWriter
class WebPMemoryWriterRAII
{
private:
    WebPMemoryWriter writer_;

public:
    WebPMemoryWriterRAII() { WebPMemoryWriterInit(&writer_); }
    ~WebPMemoryWriterRAII() { WebPMemoryWriterClear(&writer_); }

    WebPMemoryWriter *get() { return &writer_; }
    const uint8_t *data() const { return writer_.mem; }
    size_t size() const { return writer_.size; }

    // Disable copy and move, the picture holds a pointer to the writer
    WebPMemoryWriterRAII(const WebPMemoryWriterRAII &) = delete;
    WebPMemoryWriterRAII &operator=(const WebPMemoryWriterRAII &) = delete;
};

// RAII wrapper for a prepared SQLite statement
class SqliteStatementRAII
{
private:
    sqlite3_stmt *stmt_;

public:
    SqliteStatementRAII() : stmt_(nullptr) {}
    ~SqliteStatementRAII()
    {
        if (stmt_)
            sqlite3_finalize(stmt_);
    }

    sqlite3_stmt *get() { return stmt_; }
    sqlite3_stmt **address() { return &stmt_; }

    // Disable copy
    SqliteStatementRAII(const SqliteStatementRAII &) = delete;
    SqliteStatementRAII &operator=(const SqliteStatementRAII &) = delete;

    // Allow move
    SqliteStatementRAII(SqliteStatementRAII &&other) noexcept : stmt_(other.stmt_)
    {
        other.stmt_ = nullptr;
    }
};
