#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "core/image_types.hpp"

/**
 * @brief Options for a single transcode
 *
 * quality < 0 selects the format default (jpeg 85, webp 80, png 9).
 * For png the quality is the zlib compression level 0-9.
 */
struct TranscodeOptions
{
    ImageFormat format = ImageFormat::JPEG;
    int quality = -1;
    int max_width = 2000;
    int max_height = 2000;

    int resolvedQuality() const
    {
        return quality < 0 ? ImageFormats::getDefaultQuality(format) : quality;
    }
};

/**
 * @brief Output format and quality for derived variants
 */
struct EncodeOptions
{
    ImageFormat format = ImageFormat::JPEG;
    int quality = -1;

    int resolvedQuality() const
    {
        return quality < 0 ? ImageFormats::getDefaultQuality(format) : quality;
    }
};

/**
 * @brief JPEG plus optional WebP rendition of one image
 */
struct WebOptimizedImage
{
    ProcessedVariant jpeg;
    std::optional<ProcessedVariant> webp;
};

/**
 * @brief Decode, resize and re-encode images
 *
 * The single primitive every derived variant is built on. Primary and
 * responsive variants use fit-inside without enlargement; thumbnails use
 * cover with a centre crop.
 */
class ImageTranscoder
{
public:
    /**
     * @brief Transcode a buffer to the requested format, shrinking it to
     *        fit the max box if it is larger
     * @param data Raw input bytes
     * @param options Target format, quality and bounding box
     * @return Encoded variant with dimensions read back from the output
     * @throws DecodeError if the input is not a decodable image
     * @throws EncodeError if the format/quality combination cannot be produced
     */
    static ProcessedVariant transcode(const std::vector<uint8_t> &data, const TranscodeOptions &options);

    /**
     * @brief Produce a JPEG and, optionally, a WebP rendition for the web
     */
    static WebOptimizedImage optimizeForWeb(const std::vector<uint8_t> &data,
                                            int max_width = 1200,
                                            int max_height = 1200,
                                            int quality = 85,
                                            bool generate_webp = true);

    /**
     * @brief Size that fits inside max_width x max_height keeping the
     *        aspect ratio, never larger than the source
     */
    static cv::Size fitInside(const cv::Size &source, int max_width, int max_height);

    /**
     * @brief Scale to cover the target box, then crop the overflow
     *        around the centre
     * @return Image of exactly target_width x target_height
     */
    static cv::Mat coverCrop(const cv::Mat &image, int target_width, int target_height);

    /**
     * @brief Decode a buffer or throw
     * @throws DecodeError when the buffer cannot be decoded
     */
    static cv::Mat decodeOrThrow(const std::vector<uint8_t> &data);

    /**
     * @brief Encode pixels and read back the authoritative size
     * @throws EncodeError when encoding fails or the output is unreadable
     */
    static ProcessedVariant encodeVariant(const cv::Mat &image, ImageFormat format, int quality);

private:
    static void checkEncodeOptions(ImageFormat format, int quality);
    static cv::Mat prepareForEncoding(const cv::Mat &image, ImageFormat format);
    static std::vector<uint8_t> encodeWithOpenCV(const cv::Mat &image, ImageFormat format, int quality);
    static std::vector<uint8_t> encodeWebP(const cv::Mat &image, int quality);
};
