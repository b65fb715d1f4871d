#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/image_transcoder.hpp"

/**
 * @brief Thumbnail box dimensions
 */
struct ThumbnailSize
{
    int width;
    int height;

    ThumbnailSize(int w = 400, int h = 400) : width(w), height(h) {}

    static ThumbnailSize small() { return ThumbnailSize(150, 150); }
    static ThumbnailSize medium() { return ThumbnailSize(400, 400); }
    static ThumbnailSize large() { return ThumbnailSize(800, 800); }

    /**
     * @brief Parse "small", "medium", "large" or an explicit "WxH"
     * @return The size, or nullopt for anything else
     */
    static std::optional<ThumbnailSize> fromString(const std::string &value);

    std::string toString() const { return std::to_string(width) + "x" + std::to_string(height); }
};

/**
 * @brief Fixed-box thumbnails using cover fit
 *
 * The output always has exactly the requested dimensions: the image is
 * scaled to cover the box and the overflow is cropped around the centre.
 * This differs on purpose from the primary path, which never crops.
 */
class ThumbnailGenerator
{
public:
    /**
     * @brief Generate a thumbnail
     * @param data Raw input bytes
     * @param size Target box
     * @param options Output format and quality
     * @throws DecodeError if the input does not decode
     * @throws EncodeError for an empty box or an unencodable format/quality
     */
    static ProcessedVariant thumbnail(const std::vector<uint8_t> &data,
                                      const ThumbnailSize &size = ThumbnailSize::medium(),
                                      const EncodeOptions &options = EncodeOptions());
};
