#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/image_types.hpp"

/**
 * @brief Limits applied to uploads before any transform work
 */
struct ValidatorConfig
{
    size_t max_file_size_bytes = 10 * 1024 * 1024;
    int max_width = 5000;
    int max_height = 5000;
    std::vector<ImageFormat> allowed_formats = {ImageFormat::JPEG, ImageFormat::PNG, ImageFormat::WEBP, ImageFormat::GIF};
};

/**
 * @brief Rejects malformed, oversized or wrong-format uploads
 *
 * Every check runs and appends its own reason. Dimensions are read from
 * the container header first, so an image over the size limits is
 * rejected without decoding its pixels. A buffer that does not decode gets
 * a single "invalid or corrupted" reason and skips only the dimension and
 * format checks, which need decoded data.
 */
class ImageValidator
{
public:
    explicit ImageValidator(ValidatorConfig config = ValidatorConfig());

    /**
     * @brief Validate a raw buffer
     * @param data Raw bytes of the upload
     * @return ValidationResult with every violation and, when the buffer
     *         decoded, its metadata
     */
    ValidationResult validate(const std::vector<uint8_t> &data) const;

    const ValidatorConfig &config() const { return config_; }

    /**
     * @brief Comma separated list of allowed format names
     */
    std::string allowedFormatsString() const;

private:
    bool isAllowedFormat(ImageFormat format) const;
    void checkDimensions(int width, int height, std::vector<std::string> &reasons) const;
    void checkFormat(ImageFormat format, std::vector<std::string> &reasons) const;

    ValidatorConfig config_;
};
