#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Storage key naming
 *
 * Keys look like "{folder}/{epoch-millis}-{suffix}.{ext}". Uniqueness is
 * probabilistic (timestamp plus random suffix) and keys are never
 * coordinated between concurrent ingestions.
 */
class StorageKeys
{
public:
    /**
     * @brief Derive a new key for an object
     * @param folder Leading path component, usually the asset category
     * @param extension File extension without the dot
     */
    static std::string generate(const std::string &folder, const std::string &extension);

    /**
     * @brief Same as generate() with an explicit timestamp
     */
    static std::string generate(const std::string &folder, const std::string &extension, int64_t epoch_millis);

    /**
     * @brief Key of the thumbnail stored next to a primary key
     *
     * "general/123-abc.jpg" becomes "general/thumbnails/123-abc.jpg".
     */
    static std::string thumbnailKeyFor(const std::string &primary_key);

    /**
     * @brief Swap the extension of the last path segment
     *
     * "general/123-abc.jpg" with "webp" becomes "general/123-abc.webp"; a
     * segment without a dot gets the extension appended.
     */
    static std::string replaceExtension(const std::string &key, const std::string &extension);

    /**
     * @brief Thumbnail URL derived by path substitution
     *
     * Replaces the first "/original/" segment with "/thumbnails/"; URLs
     * without that segment are returned unchanged.
     */
    static std::string thumbnailUrlFor(const std::string &primary_url);

    /**
     * @brief Lower-case base36 string from a cryptographic RNG
     * @throws std::runtime_error if the RNG fails
     */
    static std::string randomSuffix(size_t length = 6);

    /**
     * @brief Whether a key is safe to map onto a path or URL
     *
     * Rejects empty keys, absolute keys, "." and ".." segments and
     * characters outside [A-Za-z0-9._/-].
     */
    static bool isSafeKey(const std::string &key);
};
