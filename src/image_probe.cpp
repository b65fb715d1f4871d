#include "core/image_probe.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <climits>
#include <cmath>
#include <cstring>
#include <opencv2/imgcodecs.hpp>
#include <webp/decode.h>

namespace
{
    // magic_t must not be shared between threads; each thread loads the database once
    struct ThreadMagic
    {
        MagicCookieRAII cookie{MAGIC_MIME_TYPE | MAGIC_ERROR};
        bool loaded = false;

        ThreadMagic()
        {
            if (!cookie.valid())
            {
                Logger::error("Failed to open libmagic cookie");
                return;
            }
            if (magic_load(cookie.get(), nullptr) != 0)
            {
                const char *reason = magic_error(cookie.get());
                Logger::error("Failed to load libmagic database: " + std::string(reason ? reason : "unknown error"));
                return;
            }
            loaded = true;
        }
    };

    magic_t threadCookie()
    {
        thread_local ThreadMagic magic;
        return magic.loaded ? magic.cookie.get() : nullptr;
    }

    uint32_t readBigEndian32(const std::vector<uint8_t> &data, size_t offset)
    {
        return (static_cast<uint32_t>(data[offset]) << 24) | (static_cast<uint32_t>(data[offset + 1]) << 16) |
               (static_cast<uint32_t>(data[offset + 2]) << 8) | static_cast<uint32_t>(data[offset + 3]);
    }

    int readBigEndian16(const std::vector<uint8_t> &data, size_t offset)
    {
        return (data[offset] << 8) | data[offset + 1];
    }
}

ImageFormat ImageProbe::detectFormat(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return ImageFormat::UNKNOWN;

    magic_t magic = threadCookie();
    if (!magic)
        return ImageFormat::UNKNOWN;

    const char *mime = magic_buffer(magic, data.data(), data.size());
    if (!mime)
        return ImageFormat::UNKNOWN;

    std::string mime_type(mime);
    // Older magic databases report WebP as image/x-webp
    const std::string vendor_prefix = "image/x-";
    if (mime_type.compare(0, vendor_prefix.size(), vendor_prefix) == 0)
        mime_type = "image/" + mime_type.substr(vendor_prefix.size());

    Logger::trace("libmagic detected MIME type: " + mime_type);
    return ImageFormats::fromMimeType(mime_type);
}

cv::Mat ImageProbe::decode(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return cv::Mat();

    try
    {
        return cv::imdecode(data, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        Logger::debug("OpenCV could not decode buffer: " + std::string(e.what()));
        return cv::Mat();
    }
}

std::optional<ImageMetadata> ImageProbe::probe(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return std::nullopt;

    // Decodable content outside the known formats keeps format UNKNOWN
    return probe(data, detectFormat(data));
}

std::optional<ImageMetadata> ImageProbe::probe(const std::vector<uint8_t> &data, ImageFormat format)
{
    if (data.empty())
        return std::nullopt;

    ImageMetadata metadata;
    metadata.format = format;
    metadata.size_bytes = data.size();

    cv::Mat image = decode(data);
    if (!image.empty())
    {
        metadata.width = image.cols;
        metadata.height = image.rows;
        int channels = image.channels();
        metadata.has_alpha = (channels == 2 || channels == 4);
        metadata.color_space = (channels <= 2) ? "b-w" : "srgb";
    }
    else if (format == ImageFormat::GIF)
    {
        // OpenCV builds without a GIF reader still get dimensions from the header
        auto screen = readGifScreenSize(data);
        if (!screen)
            return std::nullopt;
        metadata.width = screen->width;
        metadata.height = screen->height;
        metadata.color_space = "srgb";
    }
    else
    {
        return std::nullopt;
    }

    if (metadata.width <= 0 || metadata.height <= 0)
        return std::nullopt;

    metadata.aspect_ratio = roundedAspectRatio(metadata.width, metadata.height);
    return metadata;
}

ImageMetadata ImageProbe::extractMetadata(const std::vector<uint8_t> &data)
{
    auto metadata = probe(data);
    if (!metadata)
    {
        Logger::error("Error extracting metadata: buffer is not a readable image");
        throw DecodeError("Failed to extract image metadata");
    }
    return *metadata;
}

cv::Size ImageProbe::readDimensions(const std::vector<uint8_t> &data, ImageFormat format)
{
    if (format == ImageFormat::WEBP)
    {
        int width = 0;
        int height = 0;
        if (WebPGetInfo(data.data(), data.size(), &width, &height))
            return cv::Size(width, height);
        return cv::Size();
    }

    cv::Mat image = decode(data);
    if (image.empty())
        return cv::Size();
    return image.size();
}

std::optional<cv::Size> ImageProbe::readHeaderSize(const std::vector<uint8_t> &data, ImageFormat format)
{
    std::optional<cv::Size> size;
    switch (format)
    {
    case ImageFormat::JPEG:
        size = readJpegFrameSize(data);
        break;
    case ImageFormat::PNG:
        size = readPngHeaderSize(data);
        break;
    case ImageFormat::WEBP:
    {
        int width = 0;
        int height = 0;
        if (WebPGetInfo(data.data(), data.size(), &width, &height))
            size = cv::Size(width, height);
        break;
    }
    case ImageFormat::GIF:
        size = readGifScreenSize(data);
        break;
    default:
        break;
    }
    return size;
}

std::optional<cv::Size> ImageProbe::readPngHeaderSize(const std::vector<uint8_t> &data)
{
    // 8 byte signature, then the IHDR chunk: length, "IHDR", big-endian width and height
    if (data.size() < 24 || std::memcmp(data.data() + 12, "IHDR", 4) != 0)
        return std::nullopt;
    uint32_t width = readBigEndian32(data, 16);
    uint32_t height = readBigEndian32(data, 20);
    if (width == 0 || height == 0 || width > INT_MAX || height > INT_MAX)
        return std::nullopt;
    return cv::Size(static_cast<int>(width), static_cast<int>(height));
}

std::optional<cv::Size> ImageProbe::readJpegFrameSize(const std::vector<uint8_t> &data)
{
    if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8)
        return std::nullopt;

    size_t pos = 2;
    while (pos + 4 <= data.size())
    {
        if (data[pos] != 0xFF)
            return std::nullopt;
        uint8_t marker = data[pos + 1];
        if (marker == 0xFF)
        {
            // Fill byte
            ++pos;
            continue;
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8))
        {
            pos += 2;
            continue;
        }
        // Scan data or end of image before any frame header
        if (marker == 0xDA || marker == 0xD9)
            return std::nullopt;

        int length = readBigEndian16(data, pos + 2);
        if (length < 2)
            return std::nullopt;

        // SOF0..SOF15, except DHT (C4), JPG (C8) and DAC (CC)
        bool frame = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (frame)
        {
            if (pos + 9 > data.size())
                return std::nullopt;
            int height = readBigEndian16(data, pos + 5);
            int width = readBigEndian16(data, pos + 7);
            if (width == 0 || height == 0)
                return std::nullopt;
            return cv::Size(width, height);
        }
        pos += 2 + static_cast<size_t>(length);
    }
    return std::nullopt;
}

std::optional<cv::Size> ImageProbe::readGifScreenSize(const std::vector<uint8_t> &data)
{
    // "GIF87a"/"GIF89a" followed by the little-endian logical screen width and height
    if (data.size() < 10)
        return std::nullopt;
    int width = data[6] | (data[7] << 8);
    int height = data[8] | (data[9] << 8);
    if (width == 0 || height == 0)
        return std::nullopt;
    return cv::Size(width, height);
}

double ImageProbe::roundedAspectRatio(int width, int height)
{
    if (width <= 0 || height <= 0)
        return 0.0;
    return std::round(static_cast<double>(width) / height * 100.0) / 100.0;
}
