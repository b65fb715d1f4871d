#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "core/image_types.hpp"

/**
 * @brief Content inspection for raw image buffers
 *
 * Format detection looks at the bytes (libmagic), never at declared
 * filenames or MIME types.
 */
class ImageProbe
{
public:
    /**
     * @brief Identify the container format of a buffer
     * @param data Raw bytes
     * @return Detected format, UNKNOWN for anything that is not an image
     */
    static ImageFormat detectFormat(const std::vector<uint8_t> &data);

    /**
     * @brief Decode a buffer into pixels, keeping alpha and bit depth
     * @param data Raw bytes
     * @return Decoded image, empty when the buffer cannot be decoded
     */
    static cv::Mat decode(const std::vector<uint8_t> &data);

    /**
     * @brief Read image properties without throwing
     * @param data Raw bytes
     * @return Metadata, or nullopt if the buffer is not a readable image
     */
    static std::optional<ImageMetadata> probe(const std::vector<uint8_t> &data);

    /**
     * @brief Read image properties of a buffer whose format is already known
     */
    static std::optional<ImageMetadata> probe(const std::vector<uint8_t> &data, ImageFormat format);

    /**
     * @brief Read image properties
     * @throws DecodeError if the buffer is not a readable image
     */
    static ImageMetadata extractMetadata(const std::vector<uint8_t> &data);

    /**
     * @brief Read width and height of an encoded buffer
     * @return Size, or an empty size if it could not be read
     */
    static cv::Size readDimensions(const std::vector<uint8_t> &data, ImageFormat format);

    /**
     * @brief Read width and height from the container header without decoding pixels
     *
     * Covers the JPEG frame header, PNG IHDR, WebP and the GIF logical screen.
     *
     * @return Size, or nullopt for other formats and truncated headers
     */
    static std::optional<cv::Size> readHeaderSize(const std::vector<uint8_t> &data, ImageFormat format);

private:
    static std::optional<cv::Size> readPngHeaderSize(const std::vector<uint8_t> &data);
    static std::optional<cv::Size> readJpegFrameSize(const std::vector<uint8_t> &data);
    static std::optional<cv::Size> readGifScreenSize(const std::vector<uint8_t> &data);
    static double roundedAspectRatio(int width, int height);
};
