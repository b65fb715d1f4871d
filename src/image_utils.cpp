#include "core/image_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

std::string ImageUtils::formatFileSize(uint64_t bytes)
{
    if (bytes == 0)
        return "0 Bytes";

    static const char *units[] = {"Bytes", "KB", "MB", "GB"};
    const double k = 1024.0;

    int unit = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) / std::log(k)));
    if (unit > 3)
        unit = 3;

    double value = static_cast<double>(bytes) / std::pow(k, unit);

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    std::string text = ss.str();

    // Drop trailing zeros and a dangling decimal point
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.')
        text.pop_back();

    return text + " " + units[unit];
}

double ImageUtils::compressionRatio(uint64_t original_size, uint64_t compressed_size)
{
    if (original_size == 0)
        return 0.0;

    double ratio = (1.0 - static_cast<double>(compressed_size) / static_cast<double>(original_size)) * 100.0;
    return std::round(ratio * 10.0) / 10.0;
}
