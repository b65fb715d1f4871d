#include "config/ingest_config.hpp"
#include "core/image_formats.hpp"
#include "core/responsive_set_generator.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    bool isScalarList(const nlohmann::json &node)
    {
        return node.is_array() && std::all_of(node.begin(), node.end(), [](const nlohmann::json &item)
                                              { return item.is_primitive() && !item.is_null(); });
    }

    // [400, 800] is stored as "400,800", the form list settings are read in
    std::string joinList(const nlohmann::json &node)
    {
        std::string joined;
        for (const auto &item : node)
        {
            if (!joined.empty())
                joined += ",";
            joined += item.is_string() ? item.get<std::string>() : item.dump();
        }
        return joined;
    }

    void applyPatch(JSONConfiguration &cfg, const nlohmann::json &patch)
    {
        // Flatten and set values
        std::function<void(const std::string &, const nlohmann::json &)> apply;
        apply = [&](const std::string &prefix, const nlohmann::json &node)
        {
            if (node.is_object())
            {
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                    apply(key, it.value());
                }
            }
            else if (!node.is_null())
            {
                if (node.is_boolean())
                    cfg.setBool(prefix, node.get<bool>());
                else if (node.is_number_integer())
                    cfg.setInt64(prefix, node.get<int64_t>());
                else if (node.is_number_float())
                    cfg.setDouble(prefix, node.get<double>());
                else if (node.is_string())
                    cfg.setString(prefix, node.get<std::string>());
                else if (isScalarList(node))
                    cfg.setString(prefix, joinList(node));
                else
                    cfg.setString(prefix, node.dump());
            }
        };
        apply("", patch);
    }

    AutoPtr<JSONConfiguration> makeConfig(const nlohmann::json &document)
    {
        AutoPtr<JSONConfiguration> cfg = new JSONConfiguration();
        std::istringstream in(document.dump());
        cfg->load(in);
        return cfg;
    }

    ImageFormat encodableFormat(const std::string &name, const std::string &key)
    {
        ImageFormat format = ImageFormats::fromString(name);
        if (!ImageFormats::isEncodable(format))
        {
            Logger::warn("Unsupported output format for " + key + ": " + name + ", using jpeg");
            return ImageFormat::JPEG;
        }
        return format;
    }
}

IngestConfig::IngestConfig()
{
    initializeDefaultConfig();
}

nlohmann::json IngestConfig::defaultConfig()
{
    return nlohmann::json{
        {"log_level", "INFO"},
        {"validation",
         {{"max_file_size_bytes", 10 * 1024 * 1024},
          {"max_width", 5000},
          {"max_height", 5000},
          {"formats", {{"jpeg", true}, {"png", true}, {"webp", true}, {"gif", true}}},
          {"mime_types",
           {{"image/jpeg", true}, {"image/jpg", true}, {"image/png", true}, {"image/gif", true}, {"image/webp", true}}}}},
        {"primary", {{"format", "jpeg"}, {"quality", -1}, {"max_width", 2000}, {"max_height", 2000}}},
        {"thumbnail", {{"size", "medium"}, {"format", "jpeg"}, {"quality", -1}, {"strategy", "upload"}}},
        {"responsive", {{"widths", "400,800,1200,1600"}, {"format", "jpeg"}, {"quality", -1}}},
        {"storage",
         {{"backend", "filesystem"},
          {"root_dir", "media_store"},
          {"public_base_url", "http://localhost:8080/media"},
          {"http", {{"endpoint", ""}, {"base_path", ""}, {"token", ""}, {"timeout_seconds", 30}}}}},
        {"database", {{"path", "media_ingest.db"}}}};
}

void IngestConfig::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = makeConfig(defaultConfig());
}

bool IngestConfig::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not found: " + path);
        return false;
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + std::string(e.what()));
        return false;
    }
    if (!document.is_object())
    {
        Logger::error("Configuration " + path + " is not a JSON object");
        return false;
    }

    AutoPtr<JSONConfiguration> tmp = makeConfig(defaultConfig());
    try
    {
        applyPatch(*tmp, document);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to apply configuration " + path + ": " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool IngestConfig::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json IngestConfig::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void IngestConfig::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(*cfg_, patch);
}

std::string IngestConfig::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int IngestConfig::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Invalid integer for " + key + ": " + e.displayText());
        return def;
    }
}

int64_t IngestConfig::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt64(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Invalid integer for " + key + ": " + e.displayText());
        return def;
    }
}

bool IngestConfig::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Invalid boolean for " + key + ": " + e.displayText());
        return def;
    }
}

bool IngestConfig::validateConfig() const
{
    bool valid = true;
    auto fail = [&valid](const std::string &message)
    {
        Logger::error(message);
        valid = false;
    };

    std::string level = logLevel();
    if (!Logger::isValidLevel(level))
        fail("Invalid log level: " + level);

    if (getInt64("validation.max_file_size_bytes", 0) <= 0)
        fail("validation.max_file_size_bytes must be positive");
    if (getInt("validation.max_width", 0) <= 0 || getInt("validation.max_height", 0) <= 0)
        fail("validation.max_width and validation.max_height must be positive");
    if (validatorConfig().allowed_formats.empty())
        fail("validation.formats enables no format");

    for (const std::string section : {"primary", "thumbnail", "responsive"})
    {
        std::string name = getString(section + ".format", "jpeg");
        ImageFormat format = ImageFormats::fromString(name);
        if (!ImageFormats::isEncodable(format))
        {
            fail("Unsupported output format for " + section + ": " + name);
            continue;
        }
        int quality = getInt(section + ".quality", -1);
        int max_quality = format == ImageFormat::PNG ? 9 : 100;
        int min_quality = format == ImageFormat::PNG ? 0 : 1;
        if (quality >= 0 && (quality < min_quality || quality > max_quality))
            fail("Invalid " + section + ".quality for " + name + ": " + std::to_string(quality));
    }

    if (getInt("primary.max_width", 0) <= 0 || getInt("primary.max_height", 0) <= 0)
        fail("primary.max_width and primary.max_height must be positive");

    std::string size = getString("thumbnail.size", "medium");
    if (!ThumbnailSize::fromString(size))
        fail("Invalid thumbnail.size: " + size);

    std::string strategy = getString("thumbnail.strategy", "upload");
    if (strategy != "upload" && strategy != "path_substitution")
        fail("Invalid thumbnail.strategy: " + strategy);

    std::string widths = getString("responsive.widths", "");
    if (parseWidths(widths).empty())
        fail("Invalid responsive.widths: " + widths);

    StorageSettings storage = storageSettings();
    if (storage.backend == "filesystem")
    {
        if (storage.root_dir.empty())
            fail("storage.root_dir is required for the filesystem backend");
    }
    else if (storage.backend == "http")
    {
        if (storage.http_endpoint.empty())
            fail("storage.http.endpoint is required for the http backend");
        if (storage.http_timeout_seconds <= 0)
            fail("storage.http.timeout_seconds must be positive");
    }
    else
    {
        fail("Invalid storage.backend: " + storage.backend);
    }

    if (databasePath().empty())
        fail("database.path is required");

    return valid;
}

std::vector<std::string> IngestConfig::unknownKeys() const
{
    std::vector<std::string> known;
    flattenKeys("", defaultConfig(), known);

    std::vector<std::string> present;
    flattenKeys("", getAll(), present);

    std::vector<std::string> unknown;
    for (const auto &key : present)
    {
        if (std::find(known.begin(), known.end(), key) == known.end())
            unknown.push_back(key);
    }
    return unknown;
}

void IngestConfig::flattenKeys(const std::string &prefix, const nlohmann::json &node, std::vector<std::string> &keys)
{
    if (!node.is_object())
    {
        keys.push_back(prefix);
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it)
        flattenKeys(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value(), keys);
}

std::string IngestConfig::logLevel() const
{
    return getString("log_level", "INFO");
}

ValidatorConfig IngestConfig::validatorConfig() const
{
    ValidatorConfig config;
    int64_t max_size = getInt64("validation.max_file_size_bytes", static_cast<int64_t>(config.max_file_size_bytes));
    if (max_size > 0)
        config.max_file_size_bytes = static_cast<size_t>(max_size);
    config.max_width = getInt("validation.max_width", config.max_width);
    config.max_height = getInt("validation.max_height", config.max_height);

    config.allowed_formats.clear();
    for (ImageFormat format : {ImageFormat::JPEG, ImageFormat::PNG, ImageFormat::WEBP, ImageFormat::GIF})
    {
        if (getBool("validation.formats." + ImageFormats::getFormatName(format), true))
            config.allowed_formats.push_back(format);
    }
    return config;
}

std::vector<std::string> IngestConfig::allowedMimeTypes() const
{
    std::vector<std::string> mimes;
    for (const char *mime : {"image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp"})
    {
        if (getBool(std::string("validation.mime_types.") + mime, true))
            mimes.push_back(mime);
    }
    return mimes;
}

TranscodeOptions IngestConfig::primaryOptions() const
{
    TranscodeOptions options;
    options.format = encodableFormat(getString("primary.format", "jpeg"), "primary.format");
    options.quality = getInt("primary.quality", -1);
    options.max_width = getInt("primary.max_width", options.max_width);
    options.max_height = getInt("primary.max_height", options.max_height);
    return options;
}

ThumbnailSize IngestConfig::thumbnailSize() const
{
    std::string value = getString("thumbnail.size", "medium");
    auto size = ThumbnailSize::fromString(value);
    if (!size)
    {
        Logger::warn("Invalid thumbnail.size: " + value + ", using medium");
        return ThumbnailSize::medium();
    }
    return *size;
}

EncodeOptions IngestConfig::thumbnailOptions() const
{
    EncodeOptions options;
    options.format = encodableFormat(getString("thumbnail.format", "jpeg"), "thumbnail.format");
    options.quality = getInt("thumbnail.quality", -1);
    return options;
}

ThumbnailStrategy IngestConfig::thumbnailStrategy() const
{
    std::string value = getString("thumbnail.strategy", "upload");
    if (value == "path_substitution")
        return ThumbnailStrategy::PATH_SUBSTITUTION;
    if (value != "upload")
        Logger::warn("Invalid thumbnail.strategy: " + value + ", using upload");
    return ThumbnailStrategy::UPLOAD;
}

std::vector<int> IngestConfig::responsiveWidths() const
{
    std::string value = getString("responsive.widths", "");
    std::vector<int> widths = parseWidths(value);
    if (widths.empty())
    {
        Logger::warn("Invalid responsive.widths: " + value + ", using defaults");
        return ResponsiveSetGenerator::defaultWidths();
    }
    return widths;
}

EncodeOptions IngestConfig::responsiveOptions() const
{
    EncodeOptions options;
    options.format = encodableFormat(getString("responsive.format", "jpeg"), "responsive.format");
    options.quality = getInt("responsive.quality", -1);
    return options;
}

StorageSettings IngestConfig::storageSettings() const
{
    StorageSettings settings;
    settings.backend = getString("storage.backend", settings.backend);
    settings.root_dir = getString("storage.root_dir", settings.root_dir);
    settings.public_base_url = getString("storage.public_base_url", settings.public_base_url);
    settings.http_endpoint = getString("storage.http.endpoint", "");
    settings.http_base_path = getString("storage.http.base_path", "");
    settings.http_token = getString("storage.http.token", "");
    settings.http_timeout_seconds = getInt("storage.http.timeout_seconds", settings.http_timeout_seconds);
    return settings;
}

std::string IngestConfig::databasePath() const
{
    return getString("database.path", "media_ingest.db");
}

std::vector<int> IngestConfig::parseWidths(const std::string &value)
{
    std::vector<int> widths;
    for (const auto &token : split(value, ','))
    {
        std::string trimmed;
        for (char c : token)
        {
            if (c != ' ' && c != '\t')
                trimmed += c;
        }
        if (trimmed.empty() || trimmed.size() > 6 ||
            !std::all_of(trimmed.begin(), trimmed.end(), [](char c)
                         { return c >= '0' && c <= '9'; }))
            return {};
        int width = std::stoi(trimmed);
        if (width <= 0)
            return {};
        widths.push_back(width);
    }
    return widths;
}

std::vector<std::string> IngestConfig::split(const std::string &s, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}
