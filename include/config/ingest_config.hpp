#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/image_validator.hpp"
#include "core/image_transcoder.hpp"
#include "core/thumbnail_generator.hpp"

/**
 * @brief Where the thumbnail URL of an ingested asset comes from
 */
enum class ThumbnailStrategy
{
    UPLOAD,           // generate, upload under {category}/thumbnails/
    PATH_SUBSTITUTION // derive from the primary URL, nothing uploaded
};

struct StorageSettings
{
    std::string backend = "filesystem";
    std::string root_dir = "media_store";
    std::string public_base_url = "http://localhost:8080/media";
    std::string http_endpoint;
    std::string http_base_path;
    std::string http_token;
    int http_timeout_seconds = 30;
};

/**
 * @brief Configuration handle for the ingestion service
 *
 * Backed by a Poco JSONConfiguration holding the defaults, with values
 * from a JSON file or patch layered on top. Keys are dotted paths, e.g.
 * "primary.max_width". Keys the service does not recognise are kept but
 * never read; unknownKeys() lists them.
 *
 * Instances are independent; nothing here is process-wide.
 */
class IngestConfig
{
public:
    IngestConfig();

    /**
     * @brief Load a JSON file over the defaults
     * @return false if the file is missing or not valid JSON; the current values are kept
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a (possibly nested) JSON object into the configuration
     */
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    int64_t getInt64(const std::string &key, int64_t def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Check every recognised key; problems are logged
     * @return true if the configuration is usable
     */
    bool validateConfig() const;

    /**
     * @brief Dotted keys present in the configuration but not recognised
     */
    std::vector<std::string> unknownKeys() const;

    static nlohmann::json defaultConfig();

    std::string logLevel() const;
    ValidatorConfig validatorConfig() const;
    std::vector<std::string> allowedMimeTypes() const;
    TranscodeOptions primaryOptions() const;
    ThumbnailSize thumbnailSize() const;
    EncodeOptions thumbnailOptions() const;
    ThumbnailStrategy thumbnailStrategy() const;
    std::vector<int> responsiveWidths() const;
    EncodeOptions responsiveOptions() const;
    StorageSettings storageSettings() const;
    std::string databasePath() const;

    /**
     * @brief Parse a comma separated list of positive widths
     * @return Widths in input order, or empty if any entry is not a positive integer
     */
    static std::vector<int> parseWidths(const std::string &value);

private:
    void initializeDefaultConfig();
    static std::vector<std::string> split(const std::string &s, char delimiter);
    static void flattenKeys(const std::string &prefix, const nlohmann::json &node, std::vector<std::string> &keys);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
