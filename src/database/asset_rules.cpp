#include "database/asset_rules.hpp"
#include <algorithm>

const std::vector<std::string> &AssetRules::categories()
{
    static const std::vector<std::string> values = {
        "workshop", "calligraphy", "events", "community", "historical", "artwork", "general"};
    return values;
}

const std::vector<std::string> &AssetRules::mimeTypes()
{
    static const std::vector<std::string> values = {
        "image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp"};
    return values;
}

bool AssetRules::isCategory(const std::string &category)
{
    const auto &values = categories();
    return std::find(values.begin(), values.end(), category) != values.end();
}

std::string AssetRules::trim(const std::string &value)
{
    const char *whitespace = " \t\n\r\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return "";
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

size_t AssetRules::characterCount(const std::string &value)
{
    size_t count = 0;
    for (unsigned char c : value)
    {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

AssetFields AssetRules::normalize(const AssetFields &fields)
{
    AssetFields normalized;
    normalized.title = trim(fields.title);
    normalized.description = trim(fields.description);
    normalized.alt = trim(fields.alt);

    std::string category = fields.category ? trim(*fields.category) : "";
    normalized.category = category.empty() ? "general" : category;
    normalized.priority = fields.priority.value_or(0);
    return normalized;
}

AssetPatch AssetRules::normalize(const AssetPatch &patch)
{
    AssetPatch normalized = patch;
    if (normalized.title)
        normalized.title = trim(*normalized.title);
    if (normalized.description)
        normalized.description = trim(*normalized.description);
    if (normalized.alt)
        normalized.alt = trim(*normalized.alt);
    if (normalized.category)
        normalized.category = trim(*normalized.category);
    return normalized;
}

std::vector<std::string> AssetRules::check(const AssetFields &fields, const std::string &declared_mime,
                                          const std::vector<std::string> &allowed_mimes)
{
    std::vector<std::string> reasons;
    checkTitle(fields.title, reasons);
    checkDescription(fields.description, reasons);
    checkAlt(fields.alt, reasons);
    checkCategory(fields.category.value_or("general"), reasons);
    checkPriority(fields.priority.value_or(0), reasons);

    if (std::find(allowed_mimes.begin(), allowed_mimes.end(), declared_mime) == allowed_mimes.end())
    {
        reasons.push_back("Invalid file type. Only JPEG, PNG, GIF, and WebP images are allowed.");
    }
    return reasons;
}

std::vector<std::string> AssetRules::check(const AssetPatch &patch)
{
    std::vector<std::string> reasons;
    if (patch.title)
        checkTitle(*patch.title, reasons);
    if (patch.description)
        checkDescription(*patch.description, reasons);
    if (patch.alt)
        checkAlt(*patch.alt, reasons);
    if (patch.category)
        checkCategory(*patch.category, reasons);
    if (patch.priority)
        checkPriority(*patch.priority, reasons);
    return reasons;
}

void AssetRules::checkTitle(const std::string &title, std::vector<std::string> &reasons)
{
    if (title.empty())
        reasons.push_back("Image title is required");
    else if (characterCount(title) > MAX_TITLE_LENGTH)
        reasons.push_back("Title cannot exceed 200 characters");
}

void AssetRules::checkDescription(const std::string &description, std::vector<std::string> &reasons)
{
    if (characterCount(description) > MAX_DESCRIPTION_LENGTH)
        reasons.push_back("Description cannot exceed 1000 characters");
}

void AssetRules::checkAlt(const std::string &alt, std::vector<std::string> &reasons)
{
    if (alt.empty())
        reasons.push_back("Alt text is required for accessibility");
    else if (characterCount(alt) > MAX_ALT_LENGTH)
        reasons.push_back("Alt text cannot exceed 300 characters");
}

void AssetRules::checkCategory(const std::string &category, std::vector<std::string> &reasons)
{
    if (!isCategory(category))
        reasons.push_back("Invalid category: " + category);
}

void AssetRules::checkPriority(int priority, std::vector<std::string> &reasons)
{
    if (priority < MIN_PRIORITY)
        reasons.push_back("Priority cannot be less than -100");
    else if (priority > MAX_PRIORITY)
        reasons.push_back("Priority cannot exceed 100");
}
