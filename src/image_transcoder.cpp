#include "core/image_transcoder.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/image_probe.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <webp/encode.h>

ProcessedVariant ImageTranscoder::transcode(const std::vector<uint8_t> &data, const TranscodeOptions &options)
{
    const int quality = options.resolvedQuality();
    checkEncodeOptions(options.format, quality);
    if (options.max_width <= 0 || options.max_height <= 0)
    {
        throw EncodeError("Invalid bounding box " + std::to_string(options.max_width) + "x" +
                          std::to_string(options.max_height));
    }

    cv::Mat image = decodeOrThrow(data);

    cv::Mat output = image;
    if (image.cols > options.max_width || image.rows > options.max_height)
    {
        cv::Size target = fitInside(image.size(), options.max_width, options.max_height);
        try
        {
            cv::resize(image, output, target, 0, 0, cv::INTER_AREA);
        }
        catch (const cv::Exception &e)
        {
            Logger::error("OpenCV error during resize: " + std::string(e.what()));
            throw EncodeError("Failed to resize image: " + std::string(e.what()));
        }
        Logger::debug("Resized " + std::to_string(image.cols) + "x" + std::to_string(image.rows) +
                      " to " + std::to_string(target.width) + "x" + std::to_string(target.height));
    }

    return encodeVariant(output, options.format, quality);
}

WebOptimizedImage ImageTranscoder::optimizeForWeb(const std::vector<uint8_t> &data,
                                                  int max_width,
                                                  int max_height,
                                                  int quality,
                                                  bool generate_webp)
{
    TranscodeOptions jpeg_options;
    jpeg_options.format = ImageFormat::JPEG;
    jpeg_options.quality = quality;
    jpeg_options.max_width = max_width;
    jpeg_options.max_height = max_height;

    WebOptimizedImage result;
    result.jpeg = transcode(data, jpeg_options);

    if (generate_webp)
    {
        TranscodeOptions webp_options;
        webp_options.format = ImageFormat::WEBP;
        webp_options.max_width = max_width;
        webp_options.max_height = max_height;
        result.webp = transcode(data, webp_options);
    }

    return result;
}

cv::Size ImageTranscoder::fitInside(const cv::Size &source, int max_width, int max_height)
{
    if (source.width <= 0 || source.height <= 0)
        return source;

    double scale = std::min(static_cast<double>(max_width) / source.width,
                            static_cast<double>(max_height) / source.height);
    if (scale >= 1.0)
        return source;

    int width = static_cast<int>(std::lround(source.width * scale));
    int height = static_cast<int>(std::lround(source.height * scale));
    width = std::min(std::max(width, 1), max_width);
    height = std::min(std::max(height, 1), max_height);
    return cv::Size(width, height);
}

cv::Mat ImageTranscoder::coverCrop(const cv::Mat &image, int target_width, int target_height)
{
    double scale = std::max(static_cast<double>(target_width) / image.cols,
                            static_cast<double>(target_height) / image.rows);

    int scaled_width = std::max(target_width, static_cast<int>(std::lround(image.cols * scale)));
    int scaled_height = std::max(target_height, static_cast<int>(std::lround(image.rows * scale)));

    cv::Mat scaled;
    int interpolation = scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC;
    cv::resize(image, scaled, cv::Size(scaled_width, scaled_height), 0, 0, interpolation);

    int x = (scaled_width - target_width) / 2;
    int y = (scaled_height - target_height) / 2;
    return scaled(cv::Rect(x, y, target_width, target_height)).clone();
}

cv::Mat ImageTranscoder::decodeOrThrow(const std::vector<uint8_t> &data)
{
    cv::Mat image = ImageProbe::decode(data);
    if (image.empty())
    {
        Logger::error("Failed to decode image buffer of " + std::to_string(data.size()) + " bytes");
        throw DecodeError("Invalid image file or corrupted data");
    }
    return image;
}

ProcessedVariant ImageTranscoder::encodeVariant(const cv::Mat &image, ImageFormat format, int quality)
{
    checkEncodeOptions(format, quality);

    std::vector<uint8_t> encoded;
    try
    {
        cv::Mat prepared = prepareForEncoding(image, format);
        if (format == ImageFormat::WEBP)
            encoded = encodeWebP(prepared, quality);
        else
            encoded = encodeWithOpenCV(prepared, format, quality);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during encoding: " + std::string(e.what()));
        throw EncodeError("Failed to encode " + ImageFormats::getFormatName(format) + ": " + e.what());
    }

    // Encoders may adjust dimensions, so read them back from the output
    cv::Size actual = ImageProbe::readDimensions(encoded, format);
    if (actual.width <= 0 || actual.height <= 0)
    {
        throw EncodeError("Encoded " + ImageFormats::getFormatName(format) + " output could not be read back");
    }

    ProcessedVariant variant;
    variant.data = std::move(encoded);
    variant.format = format;
    variant.width = actual.width;
    variant.height = actual.height;

    Logger::debug("Encoded " + ImageFormats::getFormatName(format) + " " + std::to_string(variant.width) + "x" +
                  std::to_string(variant.height) + " (" + std::to_string(variant.size()) + " bytes, quality " +
                  std::to_string(quality) + ")");
    return variant;
}

void ImageTranscoder::checkEncodeOptions(ImageFormat format, int quality)
{
    if (!ImageFormats::isEncodable(format))
    {
        throw EncodeError("Unsupported output format: " + ImageFormats::getFormatName(format));
    }

    if (format == ImageFormat::PNG)
    {
        if (quality < 0 || quality > 9)
            throw EncodeError("PNG compression level must be between 0 and 9, got " + std::to_string(quality));
    }
    else if (quality < 1 || quality > 100)
    {
        throw EncodeError(ImageFormats::getFormatName(format) + " quality must be between 1 and 100, got " +
                          std::to_string(quality));
    }
}

cv::Mat ImageTranscoder::prepareForEncoding(const cv::Mat &image, ImageFormat format)
{
    cv::Mat output = image;

    if (output.depth() == CV_16U)
        output.convertTo(output, CV_8U, 1.0 / 257.0);
    else if (output.depth() != CV_8U)
        output.convertTo(output, CV_8U);

    if (format == ImageFormat::JPEG)
    {
        // JPEG has no alpha channel
        if (output.channels() == 4)
            cv::cvtColor(output, output, cv::COLOR_BGRA2BGR);
        else if (output.channels() == 2)
            cv::extractChannel(output, output, 0);
    }
    else if (format == ImageFormat::WEBP)
    {
        if (output.channels() == 1)
            cv::cvtColor(output, output, cv::COLOR_GRAY2BGR);
        else if (output.channels() == 2)
        {
            cv::Mat gray;
            cv::extractChannel(output, gray, 0);
            cv::cvtColor(gray, output, cv::COLOR_GRAY2BGR);
        }
    }

    if (!output.isContinuous())
        output = output.clone();
    return output;
}

std::vector<uint8_t> ImageTranscoder::encodeWithOpenCV(const cv::Mat &image, ImageFormat format, int quality)
{
    std::string extension;
    std::vector<int> params;

    if (format == ImageFormat::JPEG)
    {
        extension = ".jpg";
        params = {cv::IMWRITE_JPEG_QUALITY, quality,
                  cv::IMWRITE_JPEG_PROGRESSIVE, 1,
                  cv::IMWRITE_JPEG_OPTIMIZE, 1};
    }
    else
    {
        extension = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION, quality};
    }

    std::vector<uint8_t> buffer;
    if (!cv::imencode(extension, image, buffer, params) || buffer.empty())
    {
        throw EncodeError("Failed to encode " + ImageFormats::getFormatName(format));
    }
    return buffer;
}

std::vector<uint8_t> ImageTranscoder::encodeWebP(const cv::Mat &image, int quality)
{
    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_DEFAULT, static_cast<float>(quality)))
    {
        throw EncodeError("WebPConfigPreset failed");
    }
    // Slowest method, best compression
    config.method = 6;
    if (!WebPValidateConfig(&config))
    {
        throw EncodeError("Invalid WebP encoder configuration");
    }

    WebPMemoryWriterRAII writer;
    WebPPictureRAII picture;
    if (!picture.valid())
    {
        throw EncodeError("WebPPictureInit failed");
    }
    picture.get()->width = image.cols;
    picture.get()->height = image.rows;

    int stride = static_cast<int>(image.step[0]);
    int imported = (image.channels() == 4)
                       ? WebPPictureImportBGRA(picture.get(), image.data, stride)
                       : WebPPictureImportBGR(picture.get(), image.data, stride);
    if (!imported)
    {
        throw EncodeError("WebP picture import failed");
    }

    picture.get()->writer = WebPMemoryWrite;
    picture.get()->custom_ptr = writer.get();

    if (!WebPEncode(&config, picture.get()))
    {
        throw EncodeError("WebPEncode failed with error code " + std::to_string(picture.get()->error_code));
    }

    return std::vector<uint8_t>(writer.data(), writer.data() + writer.size());
}
