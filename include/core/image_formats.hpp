#pragma once

#include <algorithm>
#include <cctype>
#include <string>

/**
 * @brief Image container formats understood by the ingestion pipeline
 *
 * JPEG, WEBP and PNG can be both decoded and produced. GIF is accepted on
 * input only; UNKNOWN marks content that could not be identified.
 */
enum class ImageFormat
{
    JPEG,
    PNG,
    WEBP,
    GIF,
    UNKNOWN
};

class ImageFormats
{
public:
    /**
     * @brief Get the canonical lower-case name of a format
     * @param format The image format
     * @return "jpeg", "png", "webp", "gif" or "unknown"
     */
    static std::string getFormatName(ImageFormat format)
    {
        switch (format)
        {
        case ImageFormat::JPEG:
            return "jpeg";
        case ImageFormat::PNG:
            return "png";
        case ImageFormat::WEBP:
            return "webp";
        case ImageFormat::GIF:
            return "gif";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Get the MIME type written alongside stored objects
     */
    static std::string getMimeType(ImageFormat format)
    {
        switch (format)
        {
        case ImageFormat::JPEG:
            return "image/jpeg";
        case ImageFormat::PNG:
            return "image/png";
        case ImageFormat::WEBP:
            return "image/webp";
        case ImageFormat::GIF:
            return "image/gif";
        default:
            return "application/octet-stream";
        }
    }

    /**
     * @brief Get the file extension (without dot) used in storage keys
     */
    static std::string getExtension(ImageFormat format)
    {
        switch (format)
        {
        case ImageFormat::JPEG:
            return "jpg";
        case ImageFormat::PNG:
            return "png";
        case ImageFormat::WEBP:
            return "webp";
        case ImageFormat::GIF:
            return "gif";
        default:
            return "bin";
        }
    }

    /**
     * @brief Convert a format name to ImageFormat
     * @param format_str Name such as "jpeg", "JPG" or "webp"
     * @return Matching format, or UNKNOWN when not recognised
     */
    static ImageFormat fromString(const std::string &format_str)
    {
        std::string name = format_str;
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);

        if (name == "jpeg" || name == "jpg")
            return ImageFormat::JPEG;
        else if (name == "png")
            return ImageFormat::PNG;
        else if (name == "webp")
            return ImageFormat::WEBP;
        else if (name == "gif")
            return ImageFormat::GIF;
        else
            return ImageFormat::UNKNOWN;
    }

    /**
     * @brief Convert a MIME type such as "image/png" to ImageFormat
     */
    static ImageFormat fromMimeType(const std::string &mime_type)
    {
        std::string mime = mime_type;
        std::transform(mime.begin(), mime.end(), mime.begin(), ::tolower);

        const std::string prefix = "image/";
        if (mime.compare(0, prefix.size(), prefix) != 0)
            return ImageFormat::UNKNOWN;
        return fromString(mime.substr(prefix.size()));
    }

    /**
     * @brief Whether the pipeline can encode output in this format
     */
    static bool isEncodable(ImageFormat format)
    {
        return format == ImageFormat::JPEG || format == ImageFormat::PNG || format == ImageFormat::WEBP;
    }

    /**
     * @brief Default quality for an output format
     *
     * For PNG the value is a zlib compression level (0-9), not a
     * perceptual quality.
     */
    static int getDefaultQuality(ImageFormat format)
    {
        switch (format)
        {
        case ImageFormat::JPEG:
            return 85;
        case ImageFormat::WEBP:
            return 80;
        case ImageFormat::PNG:
            return 9;
        default:
            return 0;
        }
    }
};
