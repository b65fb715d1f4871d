#include "storage/storage_keys.hpp"
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/rand.h>

std::string StorageKeys::generate(const std::string &folder, const std::string &extension)
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return generate(folder, extension, static_cast<int64_t>(millis));
}

std::string StorageKeys::generate(const std::string &folder, const std::string &extension, int64_t epoch_millis)
{
    std::string key = folder.empty() ? "general" : folder;
    key += "/" + std::to_string(epoch_millis) + "-" + randomSuffix();
    if (!extension.empty())
        key += "." + extension;
    return key;
}

std::string StorageKeys::thumbnailKeyFor(const std::string &primary_key)
{
    size_t slash = primary_key.rfind('/');
    if (slash == std::string::npos)
        return "thumbnails/" + primary_key;
    return primary_key.substr(0, slash) + "/thumbnails/" + primary_key.substr(slash + 1);
}

std::string StorageKeys::replaceExtension(const std::string &key, const std::string &extension)
{
    size_t slash = key.rfind('/');
    size_t dot = key.rfind('.');
    std::string stem = (dot != std::string::npos && (slash == std::string::npos || dot > slash)) ? key.substr(0, dot) : key;
    return extension.empty() ? stem : stem + "." + extension;
}

std::string StorageKeys::thumbnailUrlFor(const std::string &primary_url)
{
    const std::string from = "/original/";
    const std::string to = "/thumbnails/";

    std::string url = primary_url;
    size_t pos = url.find(from);
    if (pos != std::string::npos)
        url.replace(pos, from.size(), to);
    return url;
}

std::string StorageKeys::randomSuffix(size_t length)
{
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::vector<unsigned char> bytes(length);
    if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
    {
        throw std::runtime_error("Failed to generate random key suffix");
    }

    std::string suffix;
    suffix.reserve(length);
    for (unsigned char b : bytes)
        suffix += alphabet[b % 36];
    return suffix;
}

bool StorageKeys::isSafeKey(const std::string &key)
{
    if (key.empty() || key.front() == '/')
        return false;

    for (char c : key)
    {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                       c == '.' || c == '_' || c == '-' || c == '/';
        if (!allowed)
            return false;
    }

    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '/'))
    {
        if (segment.empty() || segment == "." || segment == "..")
            return false;
    }
    return key.back() != '/';
}
