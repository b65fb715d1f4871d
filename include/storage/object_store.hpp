#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Location of an object after a successful upload
 */
struct StoredObject
{
    std::string url;
    std::string key;
};

/**
 * @brief Durable object storage addressed by key
 *
 * Implementations report every I/O failure as StorageError. Removing a
 * key that does not exist is not an error.
 */
class ObjectStore
{
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Store bytes under a key, replacing any previous object
     * @param key Storage key such as "general/1700000000000-a1b2c3.jpg"
     * @param data Object contents
     * @param content_type MIME type recorded with the object
     * @return Public URL and key of the stored object
     * @throws StorageError on failure
     */
    virtual StoredObject upload(const std::string &key, const std::vector<uint8_t> &data,
                                const std::string &content_type) = 0;

    /**
     * @brief Delete the object stored under a key
     * @throws StorageError on failure
     */
    virtual void remove(const std::string &key) = 0;

    /**
     * @brief Check whether an object exists
     * @throws StorageError if the store cannot be queried
     */
    virtual bool exists(const std::string &key) = 0;

    /**
     * @brief Public URL an object has, or would have, under this key
     */
    virtual std::string urlFor(const std::string &key) const = 0;

    /**
     * @brief Short backend name used in logs
     */
    virtual std::string name() const = 0;
};
