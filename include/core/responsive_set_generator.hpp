#pragma once

#include <cstdint>
#include <vector>
#include "core/image_transcoder.hpp"

/**
 * @brief One width-bounded variant of a responsive set
 */
struct ResponsiveVariant
{
    int width = 0; // Requested bound, not the output width
    ProcessedVariant image;
};

/**
 * @brief Width-bounded variants generated in parallel
 *
 * Each requested width is used as both max width and max height, so the
 * larger dimension is capped and the aspect ratio kept. The batch is
 * all-or-nothing: if any single width fails, the whole call fails.
 */
class ResponsiveSetGenerator
{
public:
    static std::vector<int> defaultWidths() { return {400, 800, 1200, 1600}; }

    /**
     * @brief Generate one variant per requested width
     * @param data Raw input bytes
     * @param widths Bounds to generate, in output order
     * @param options Output format and quality shared by all variants
     * @return Variants in the same order as widths
     * @throws DecodeError or EncodeError from the first failing width
     */
    static std::vector<ResponsiveVariant> responsiveSet(const std::vector<uint8_t> &data,
                                                        const std::vector<int> &widths = defaultWidths(),
                                                        const EncodeOptions &options = EncodeOptions());
};
