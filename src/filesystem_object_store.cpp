#include "storage/filesystem_object_store.hpp"
#include "storage/storage_keys.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <fstream>

namespace fs = std::filesystem;

FilesystemObjectStore::FilesystemObjectStore(const std::string &root_dir, const std::string &public_base_url)
    : root_dir_(root_dir), public_base_url_(public_base_url)
{
    while (!public_base_url_.empty() && public_base_url_.back() == '/')
        public_base_url_.pop_back();

    std::error_code ec;
    fs::create_directories(root_dir_, ec);
    if (ec)
    {
        throw StorageError("Failed to create storage directory " + root_dir_.string() + ": " + ec.message(), "");
    }
    Logger::info("Filesystem object store rooted at " + root_dir_.string());
}

StoredObject FilesystemObjectStore::upload(const std::string &key, const std::vector<uint8_t> &data,
                                           const std::string &content_type)
{
    fs::path target = pathFor(key);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        Logger::error("Storage upload error for " + key + ": " + ec.message());
        throw StorageError("Failed to upload file to storage: " + ec.message(), key);
    }

    fs::path temp = target;
    temp += ".tmp-" + StorageKeys::randomSuffix(8);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            Logger::error("Storage upload error for " + key + ": cannot open " + temp.string());
            throw StorageError("Failed to upload file to storage: cannot open " + temp.string(), key);
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out)
        {
            fs::remove(temp, ec);
            Logger::error("Storage upload error for " + key + ": short write");
            throw StorageError("Failed to upload file to storage: write failed for " + key, key);
        }
    }

    fs::rename(temp, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        Logger::error("Storage upload error for " + key + ": " + ec.message());
        throw StorageError("Failed to upload file to storage: " + ec.message(), key);
    }

    Logger::debug("Stored " + std::to_string(data.size()) + " bytes (" + content_type + ") at " + target.string());
    return StoredObject{urlFor(key), key};
}

void FilesystemObjectStore::remove(const std::string &key)
{
    fs::path target = pathFor(key);

    std::error_code ec;
    bool removed = fs::remove(target, ec);
    if (ec)
    {
        Logger::error("Storage delete error for " + key + ": " + ec.message());
        throw StorageError("Failed to delete file from storage: " + ec.message(), key);
    }
    if (!removed)
        Logger::debug("Storage delete for missing key: " + key);
}

bool FilesystemObjectStore::exists(const std::string &key)
{
    std::error_code ec;
    bool found = fs::is_regular_file(pathFor(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        throw StorageError("Failed to query storage: " + ec.message(), key);
    }
    return found;
}

std::string FilesystemObjectStore::urlFor(const std::string &key) const
{
    return public_base_url_ + "/" + key;
}

fs::path FilesystemObjectStore::pathFor(const std::string &key) const
{
    if (!StorageKeys::isSafeKey(key))
    {
        throw StorageError("Invalid storage key: " + key, key);
    }
    return root_dir_ / fs::path(key);
}
