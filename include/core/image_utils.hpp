#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Small numeric helpers shared by the pipeline and its callers
 */
class ImageUtils
{
public:
    /**
     * @brief Human readable byte count using 1024-based units
     * @param bytes Size in bytes
     * @return e.g. "0 Bytes", "500 Bytes", "1.5 KB", "10 MB"
     */
    static std::string formatFileSize(uint64_t bytes);

    /**
     * @brief Percentage saved by compression, rounded to one decimal
     * @param original_size Size before compression
     * @param compressed_size Size after compression
     * @return (1 - compressed/original) * 100, or 0.0 when original_size is 0
     */
    static double compressionRatio(uint64_t original_size, uint64_t compressed_size);
};
