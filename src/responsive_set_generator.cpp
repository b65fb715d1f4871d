#include "core/responsive_set_generator.hpp"
#include "core/ingest_errors.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

std::vector<ResponsiveVariant> ResponsiveSetGenerator::responsiveSet(const std::vector<uint8_t> &data,
                                                                     const std::vector<int> &widths,
                                                                     const EncodeOptions &options)
{
    std::vector<ResponsiveVariant> results(widths.size());
    if (widths.empty())
        return results;

    Logger::info("Generating " + std::to_string(widths.size()) + " responsive sizes as " +
                 ImageFormats::getFormatName(options.format));

    try
    {
        // Each slot is written by exactly one task, so no locking is needed
        tbb::parallel_for(tbb::blocked_range<size_t>(0, widths.size()),
                          [&](const tbb::blocked_range<size_t> &range)
                          {
                              for (size_t i = range.begin(); i != range.end(); ++i)
                              {
                                  TranscodeOptions transcode_options;
                                  transcode_options.format = options.format;
                                  transcode_options.quality = options.quality;
                                  transcode_options.max_width = widths[i];
                                  transcode_options.max_height = widths[i];

                                  results[i].width = widths[i];
                                  results[i].image = ImageTranscoder::transcode(data, transcode_options);
                              }
                          });
    }
    catch (const IngestionError &e)
    {
        Logger::error("Error generating responsive sizes: " + std::string(e.what()));
        throw;
    }

    return results;
}
