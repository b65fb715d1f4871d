#include "core/image_validator.hpp"
#include "core/image_probe.hpp"
#include "core/image_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>

ImageValidator::ImageValidator(ValidatorConfig config)
    : config_(std::move(config))
{
}

ValidationResult ImageValidator::validate(const std::vector<uint8_t> &data) const
{
    ValidationResult result;

    if (data.size() > config_.max_file_size_bytes)
    {
        const size_t mib = 1024 * 1024;
        std::string limit = (config_.max_file_size_bytes % mib == 0)
                                ? std::to_string(config_.max_file_size_bytes / mib) + "MB"
                                : ImageUtils::formatFileSize(config_.max_file_size_bytes);
        result.reasons.push_back("File size too large. Maximum size is " + limit);
    }

    // Oversized dimensions are rejected from the header, before pixels are allocated
    ImageFormat format = ImageProbe::detectFormat(data);
    auto header = ImageProbe::readHeaderSize(data, format);
    if (header && (header->width > config_.max_width || header->height > config_.max_height))
    {
        checkDimensions(header->width, header->height, result.reasons);
        checkFormat(format, result.reasons);
        Logger::debug("Rejected " + ImageFormats::getFormatName(format) + " image " + std::to_string(header->width) +
                      "x" + std::to_string(header->height) + " from its header (" +
                      std::to_string(result.reasons.size()) + " violation(s))");
        return result;
    }

    auto metadata = ImageProbe::probe(data, format);
    if (!metadata)
    {
        result.reasons.push_back("Invalid image file or corrupted data");
        Logger::debug("Validation finished with " + std::to_string(result.reasons.size()) + " violation(s), buffer did not decode");
        return result;
    }

    checkDimensions(metadata->width, metadata->height, result.reasons);
    checkFormat(metadata->format, result.reasons);

    result.metadata = metadata;

    Logger::debug("Validated " + ImageFormats::getFormatName(metadata->format) + " image " +
                  std::to_string(metadata->width) + "x" + std::to_string(metadata->height) + " (" +
                  std::to_string(result.reasons.size()) + " violation(s))");
    return result;
}

void ImageValidator::checkDimensions(int width, int height, std::vector<std::string> &reasons) const
{
    if (width > config_.max_width)
    {
        reasons.push_back("Image width too large. Maximum width is " + std::to_string(config_.max_width) + "px");
    }
    if (height > config_.max_height)
    {
        reasons.push_back("Image height too large. Maximum height is " + std::to_string(config_.max_height) + "px");
    }
}

void ImageValidator::checkFormat(ImageFormat format, std::vector<std::string> &reasons) const
{
    if (!isAllowedFormat(format))
        reasons.push_back("Unsupported format. Allowed formats: " + allowedFormatsString());
}

std::string ImageValidator::allowedFormatsString() const
{
    std::string names;
    for (const auto &format : config_.allowed_formats)
    {
        if (!names.empty())
            names += ", ";
        names += ImageFormats::getFormatName(format);
    }
    return names;
}

bool ImageValidator::isAllowedFormat(ImageFormat format) const
{
    if (format == ImageFormat::UNKNOWN)
        return false;
    return std::find(config_.allowed_formats.begin(), config_.allowed_formats.end(), format) != config_.allowed_formats.end();
}
