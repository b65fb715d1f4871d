#include "storage/http_object_store.hpp"
#include "storage/storage_keys.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>

namespace
{
    std::string trimTrailingSlashes(std::string value)
    {
        while (!value.empty() && value.back() == '/')
            value.pop_back();
        return value;
    }

    httplib::Client makeClient(const std::string &endpoint, const std::string &token, int timeout_seconds)
    {
        httplib::Client client(endpoint);
        client.set_connection_timeout(timeout_seconds, 0);
        client.set_read_timeout(timeout_seconds, 0);
        client.set_write_timeout(timeout_seconds, 0);
        if (!token.empty())
            client.set_bearer_token_auth(token);
        return client;
    }
}

HttpObjectStore::HttpObjectStore(const std::string &endpoint,
                                 const std::string &base_path,
                                 const std::string &token,
                                 const std::string &public_base_url,
                                 int timeout_seconds)
    : endpoint_(trimTrailingSlashes(endpoint)),
      base_path_(trimTrailingSlashes(base_path)),
      token_(token),
      public_base_url_(trimTrailingSlashes(public_base_url)),
      timeout_seconds_(timeout_seconds)
{
    if (endpoint_.empty())
    {
        throw StorageError("HTTP object store requires an endpoint", "");
    }
    if (!base_path_.empty() && base_path_.front() != '/')
        base_path_ = "/" + base_path_;
    if (public_base_url_.empty())
        public_base_url_ = endpoint_ + base_path_;

    Logger::info("HTTP object store using " + endpoint_ + base_path_);
}

StoredObject HttpObjectStore::upload(const std::string &key, const std::vector<uint8_t> &data,
                                     const std::string &content_type)
{
    auto client = makeClient(endpoint_, token_, timeout_seconds_);
    auto res = client.Put(objectPath(key), reinterpret_cast<const char *>(data.data()), data.size(), content_type);
    if (!res)
    {
        std::string reason = httplib::to_string(res.error());
        Logger::error("Storage upload error for " + key + ": " + reason);
        throw StorageError("Failed to upload file to storage: " + reason, key);
    }
    if (res->status < 200 || res->status >= 300)
    {
        Logger::error("Storage upload error for " + key + ": HTTP " + std::to_string(res->status));
        throw StorageError("Failed to upload file to storage: HTTP " + std::to_string(res->status), key);
    }

    Logger::debug("Uploaded " + std::to_string(data.size()) + " bytes to " + endpoint_ + objectPath(key));
    return StoredObject{urlFor(key), key};
}

void HttpObjectStore::remove(const std::string &key)
{
    auto client = makeClient(endpoint_, token_, timeout_seconds_);
    auto res = client.Delete(objectPath(key));
    if (!res)
    {
        std::string reason = httplib::to_string(res.error());
        Logger::error("Storage delete error for " + key + ": " + reason);
        throw StorageError("Failed to delete file from storage: " + reason, key);
    }
    if (res->status == 404)
    {
        Logger::debug("Storage delete for missing key: " + key);
        return;
    }
    if (res->status < 200 || res->status >= 300)
    {
        Logger::error("Storage delete error for " + key + ": HTTP " + std::to_string(res->status));
        throw StorageError("Failed to delete file from storage: HTTP " + std::to_string(res->status), key);
    }
}

bool HttpObjectStore::exists(const std::string &key)
{
    auto client = makeClient(endpoint_, token_, timeout_seconds_);
    auto res = client.Head(objectPath(key));
    if (!res)
    {
        throw StorageError("Failed to query storage: " + httplib::to_string(res.error()), key);
    }
    if (res->status == 404)
        return false;
    if (res->status < 200 || res->status >= 300)
    {
        throw StorageError("Failed to query storage: HTTP " + std::to_string(res->status), key);
    }
    return true;
}

std::string HttpObjectStore::urlFor(const std::string &key) const
{
    return public_base_url_ + "/" + key;
}

std::string HttpObjectStore::objectPath(const std::string &key) const
{
    if (!StorageKeys::isSafeKey(key))
    {
        throw StorageError("Invalid storage key: " + key, key);
    }
    return base_path_ + "/" + key;
}
