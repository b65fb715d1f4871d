#pragma once

#include <optional>
#include <string>
#include <vector>
#include "database/metadata_store.hpp"

/**
 * @brief Caller-declared fields of an upload
 */
struct AssetFields
{
    std::string title;
    std::string description;
    std::string alt;
    std::optional<std::string> category;
    std::optional<int> priority;
};

/**
 * @brief Field constraints for ImageAsset records
 *
 * Every check runs and every violation is reported, so a caller can show
 * all problems at once. Strings are trimmed before they are checked.
 */
class AssetRules
{
public:
    static constexpr size_t MAX_TITLE_LENGTH = 200;
    static constexpr size_t MAX_DESCRIPTION_LENGTH = 1000;
    static constexpr size_t MAX_ALT_LENGTH = 300;
    static constexpr int MIN_PRIORITY = -100;
    static constexpr int MAX_PRIORITY = 100;
    static constexpr int FEATURED_PRIORITY = 50;

    static const std::vector<std::string> &categories();
    static const std::vector<std::string> &mimeTypes();
    static bool isCategory(const std::string &category);

    /**
     * @brief Trim strings and apply defaults (category "general", priority 0)
     */
    static AssetFields normalize(const AssetFields &fields);
    static AssetPatch normalize(const AssetPatch &patch);

    /**
     * @brief Check declared fields of a new upload
     *
     * Byte size and decoded dimensions are the image validator's concern
     * and are not checked here.
     *
     * @param fields Normalized fields
     * @param declared_mime MIME type the caller claimed for the bytes
     * @param allowed_mimes Accepted declared MIME types
     * @return Violations, empty when valid
     */
    static std::vector<std::string> check(const AssetFields &fields, const std::string &declared_mime,
                                          const std::vector<std::string> &allowed_mimes);
    static std::vector<std::string> check(const AssetFields &fields, const std::string &declared_mime)
    {
        return check(fields, declared_mime, mimeTypes());
    }

    /**
     * @brief Check a normalized patch; absent fields are not checked
     */
    static std::vector<std::string> check(const AssetPatch &patch);

    static bool isHighPriority(const ImageAsset &asset) { return asset.priority > FEATURED_PRIORITY; }

    static std::string trim(const std::string &value);

    /**
     * @brief Number of characters in a UTF-8 string (continuation bytes are not counted)
     */
    static size_t characterCount(const std::string &value);

private:
    static void checkTitle(const std::string &title, std::vector<std::string> &reasons);
    static void checkDescription(const std::string &description, std::vector<std::string> &reasons);
    static void checkAlt(const std::string &alt, std::vector<std::string> &reasons);
    static void checkCategory(const std::string &category, std::vector<std::string> &reasons);
    static void checkPriority(int priority, std::vector<std::string> &reasons);
};
