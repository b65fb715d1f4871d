#pragma once

#include <string>
#include "storage/object_store.hpp"

/**
 * @brief Object store speaking plain HTTP PUT/DELETE/HEAD
 *
 * Targets S3-compatible gateways and blob services that accept
 * authenticated PUTs at "{endpoint}{base_path}/{key}". The bearer token
 * is optional.
 */
class HttpObjectStore : public ObjectStore
{
public:
    /**
     * @param endpoint Scheme, host and port, e.g. "https://blob.example.com"
     * @param base_path Path prefix for objects, e.g. "/uploads"
     * @param token Bearer token, empty to send none
     * @param public_base_url Prefix of returned URLs; defaults to endpoint + base_path
     * @param timeout_seconds Connection and read timeout
     */
    HttpObjectStore(const std::string &endpoint,
                    const std::string &base_path,
                    const std::string &token = "",
                    const std::string &public_base_url = "",
                    int timeout_seconds = 30);

    StoredObject upload(const std::string &key, const std::vector<uint8_t> &data,
                        const std::string &content_type) override;
    void remove(const std::string &key) override;
    bool exists(const std::string &key) override;
    std::string urlFor(const std::string &key) const override;
    std::string name() const override { return "http"; }

private:
    std::string objectPath(const std::string &key) const;

    std::string endpoint_;
    std::string base_path_;
    std::string token_;
    std::string public_base_url_;
    int timeout_seconds_;
};
