#pragma once

#include <filesystem>
#include <string>
#include "storage/object_store.hpp"

/**
 * @brief Object store backed by a local directory
 *
 * Objects are written to a temporary file and renamed into place, so a
 * reader never sees a partial object. URLs are the public base URL
 * joined with the key.
 */
class FilesystemObjectStore : public ObjectStore
{
public:
    FilesystemObjectStore(const std::string &root_dir, const std::string &public_base_url);

    StoredObject upload(const std::string &key, const std::vector<uint8_t> &data,
                        const std::string &content_type) override;
    void remove(const std::string &key) override;
    bool exists(const std::string &key) override;
    std::string urlFor(const std::string &key) const override;
    std::string name() const override { return "filesystem"; }

    const std::filesystem::path &rootDir() const { return root_dir_; }

private:
    std::filesystem::path pathFor(const std::string &key) const;

    std::filesystem::path root_dir_;
    std::string public_base_url_;
};
