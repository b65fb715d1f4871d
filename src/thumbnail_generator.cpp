#include "core/thumbnail_generator.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

std::optional<ThumbnailSize> ThumbnailSize::fromString(const std::string &value)
{
    std::string name = value;
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    if (name == "small")
        return small();
    if (name == "medium")
        return medium();
    if (name == "large")
        return large();

    size_t separator = name.find('x');
    if (separator == std::string::npos || separator == 0 || separator == name.size() - 1)
        return std::nullopt;

    std::string width_str = name.substr(0, separator);
    std::string height_str = name.substr(separator + 1);
    auto is_number = [](const std::string &s)
    {
        return !s.empty() && s.size() <= 6 && std::all_of(s.begin(), s.end(), ::isdigit);
    };
    if (!is_number(width_str) || !is_number(height_str))
        return std::nullopt;

    int width = std::stoi(width_str);
    int height = std::stoi(height_str);
    if (width <= 0 || height <= 0)
        return std::nullopt;
    return ThumbnailSize(width, height);
}

ProcessedVariant ThumbnailGenerator::thumbnail(const std::vector<uint8_t> &data,
                                               const ThumbnailSize &size,
                                               const EncodeOptions &options)
{
    if (size.width <= 0 || size.height <= 0)
    {
        throw EncodeError("Invalid thumbnail size " + size.toString());
    }

    cv::Mat image = ImageTranscoder::decodeOrThrow(data);

    cv::Mat cropped;
    try
    {
        cropped = ImageTranscoder::coverCrop(image, size.width, size.height);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during thumbnail generation: " + std::string(e.what()));
        throw EncodeError("Failed to generate thumbnail: " + std::string(e.what()));
    }

    ProcessedVariant variant = ImageTranscoder::encodeVariant(cropped, options.format, options.resolvedQuality());
    Logger::debug("Generated " + size.toString() + " thumbnail from " + std::to_string(image.cols) + "x" +
                  std::to_string(image.rows) + " source");
    return variant;
}
