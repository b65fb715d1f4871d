#include "core/image_transcoder.hpp"
#include "core/image_probe.hpp"
#include "core/ingest_errors.hpp"
#include "test_base.hpp"

class ImageTranscoderTest : public ::testing::Test
{
protected:
    void SetUp() override { Logger::init("WARN"); }
};

TEST_F(ImageTranscoderTest, ShrinksToFitInsideBoxKeepingAspectRatio)
{
    TranscodeOptions options;
    options.max_width = 2000;
    options.max_height = 2000;

    ProcessedVariant variant = ImageTranscoder::transcode(TestImages::jpeg(3000, 1500), options);

    EXPECT_EQ(variant.format, ImageFormat::JPEG);
    EXPECT_EQ(variant.width, 2000);
    EXPECT_EQ(variant.height, 1000);
    EXPECT_EQ(TestImages::decodedSize(variant.data), cv::Size(2000, 1000));
}

TEST_F(ImageTranscoderTest, NeverUpscales)
{
    TranscodeOptions options;
    options.max_width = 800;
    options.max_height = 800;

    ProcessedVariant variant = ImageTranscoder::transcode(TestImages::png(200, 100), options);

    EXPECT_EQ(variant.width, 200);
    EXPECT_EQ(variant.height, 100);
}

TEST_F(ImageTranscoderTest, OutputAlwaysFitsTheBox)
{
    const std::vector<std::pair<int, int>> sources = {{1001, 999}, {640, 4000}, {4000, 640}, {333, 777}};
    for (const auto &source : sources)
    {
        TranscodeOptions options;
        options.max_width = 300;
        options.max_height = 200;

        ProcessedVariant variant = ImageTranscoder::transcode(TestImages::jpeg(source.first, source.second), options);
        EXPECT_LE(variant.width, 300);
        EXPECT_LE(variant.height, 200);
        EXPECT_GT(variant.width, 0);
        EXPECT_GT(variant.height, 0);
    }
}

TEST_F(ImageTranscoderTest, ConvertsBetweenFormats)
{
    auto source = TestImages::png(120, 90, true);

    TranscodeOptions webp;
    webp.format = ImageFormat::WEBP;
    ProcessedVariant webp_variant = ImageTranscoder::transcode(source, webp);
    EXPECT_EQ(webp_variant.format, ImageFormat::WEBP);
    EXPECT_EQ(ImageProbe::detectFormat(webp_variant.data), ImageFormat::WEBP);
    EXPECT_EQ(webp_variant.width, 120);

    TranscodeOptions jpeg;
    jpeg.format = ImageFormat::JPEG;
    ProcessedVariant jpeg_variant = ImageTranscoder::transcode(source, jpeg);
    EXPECT_EQ(ImageProbe::detectFormat(jpeg_variant.data), ImageFormat::JPEG);

    TranscodeOptions png;
    png.format = ImageFormat::PNG;
    ProcessedVariant png_variant = ImageTranscoder::transcode(TestImages::jpeg(50, 50), png);
    EXPECT_EQ(ImageProbe::detectFormat(png_variant.data), ImageFormat::PNG);
}

TEST_F(ImageTranscoderTest, LowerQualityGivesSmallerJpeg)
{
    auto source = TestImages::png(400, 300);

    TranscodeOptions high;
    high.quality = 95;
    TranscodeOptions low;
    low.quality = 20;

    EXPECT_LT(ImageTranscoder::transcode(source, low).size(), ImageTranscoder::transcode(source, high).size());
}

TEST_F(ImageTranscoderTest, DefaultQualityDependsOnFormat)
{
    TranscodeOptions options;
    options.format = ImageFormat::JPEG;
    EXPECT_EQ(options.resolvedQuality(), 85);
    options.format = ImageFormat::WEBP;
    EXPECT_EQ(options.resolvedQuality(), 80);
    options.format = ImageFormat::PNG;
    EXPECT_EQ(options.resolvedQuality(), 9);
    options.quality = 3;
    EXPECT_EQ(options.resolvedQuality(), 3);
}

TEST_F(ImageTranscoderTest, RejectsCorruptedInput)
{
    EXPECT_THROW(ImageTranscoder::transcode(TestImages::garbage(), TranscodeOptions()), DecodeError);
    EXPECT_THROW(ImageTranscoder::transcode({}, TranscodeOptions()), DecodeError);
}

TEST_F(ImageTranscoderTest, RejectsInvalidOptions)
{
    auto source = TestImages::jpeg(40, 40);

    TranscodeOptions bad_quality;
    bad_quality.quality = 101;
    EXPECT_THROW(ImageTranscoder::transcode(source, bad_quality), EncodeError);

    TranscodeOptions bad_png_level;
    bad_png_level.format = ImageFormat::PNG;
    bad_png_level.quality = 10;
    EXPECT_THROW(ImageTranscoder::transcode(source, bad_png_level), EncodeError);

    TranscodeOptions gif_output;
    gif_output.format = ImageFormat::GIF;
    EXPECT_THROW(ImageTranscoder::transcode(source, gif_output), EncodeError);

    TranscodeOptions empty_box;
    empty_box.max_width = 0;
    EXPECT_THROW(ImageTranscoder::transcode(source, empty_box), EncodeError);
}

TEST_F(ImageTranscoderTest, FitInside)
{
    EXPECT_EQ(ImageTranscoder::fitInside(cv::Size(4000, 3000), 2000, 2000), cv::Size(2000, 1500));
    EXPECT_EQ(ImageTranscoder::fitInside(cv::Size(1000, 4000), 2000, 2000), cv::Size(500, 2000));
    EXPECT_EQ(ImageTranscoder::fitInside(cv::Size(100, 50), 2000, 2000), cv::Size(100, 50));
    EXPECT_EQ(ImageTranscoder::fitInside(cv::Size(10000, 1), 100, 100), cv::Size(100, 1));
}

TEST_F(ImageTranscoderTest, OptimizeForWebProducesJpegAndWebp)
{
    auto source = TestImages::png(1600, 900);

    WebOptimizedImage optimized = ImageTranscoder::optimizeForWeb(source);

    EXPECT_EQ(optimized.jpeg.format, ImageFormat::JPEG);
    EXPECT_EQ(optimized.jpeg.width, 1200);
    EXPECT_EQ(optimized.jpeg.height, 675);
    ASSERT_TRUE(optimized.webp.has_value());
    EXPECT_EQ(optimized.webp->format, ImageFormat::WEBP);
    EXPECT_EQ(optimized.webp->width, 1200);
}

TEST_F(ImageTranscoderTest, OptimizeForWebCanSkipWebp)
{
    WebOptimizedImage optimized = ImageTranscoder::optimizeForWeb(TestImages::jpeg(100, 100), 1200, 1200, 85, false);
    EXPECT_FALSE(optimized.webp.has_value());
    EXPECT_EQ(optimized.jpeg.width, 100);
}
