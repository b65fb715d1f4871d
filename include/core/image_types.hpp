#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/image_formats.hpp"

/**
 * @brief An uploaded file as received from the caller
 *
 * Lives for the duration of one ingestion call only.
 */
struct RawUpload
{
    std::vector<uint8_t> data;
    std::string mime_type; // Declared by the client, not trusted
    std::string filename;  // Declared by the client, not trusted

    size_t size() const { return data.size(); }
};

/**
 * @brief Properties read from a decoded image
 */
struct ImageMetadata
{
    int width;
    int height;
    ImageFormat format;
    std::string color_space; // "srgb", "b-w" or "unknown"
    bool has_alpha;
    size_t size_bytes;
    double aspect_ratio; // width / height rounded to two decimals, 0 when unknown

    ImageMetadata()
        : width(0), height(0), format(ImageFormat::UNKNOWN), color_space("unknown"),
          has_alpha(false), size_bytes(0), aspect_ratio(0.0) {}
};

/**
 * @brief One encoded derivative of an input image
 */
struct ProcessedVariant
{
    std::vector<uint8_t> data;
    ImageFormat format;
    int width;
    int height;

    ProcessedVariant() : format(ImageFormat::UNKNOWN), width(0), height(0) {}

    size_t size() const { return data.size(); }
};

/**
 * @brief Outcome of validating an upload
 *
 * Invalid if and only if reasons is non-empty. Checks are not
 * short-circuited, so every problem is listed.
 */
struct ValidationResult
{
    std::vector<std::string> reasons;
    std::optional<ImageMetadata> metadata;

    bool isValid() const { return reasons.empty(); }
};
