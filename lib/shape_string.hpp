#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace util
{
    // Formats a tensor shape as "[1x3x?x?]"; dynamic dimensions print as '?'.
    std::string shapeString(const std::vector<int64_t>& dims);
}
