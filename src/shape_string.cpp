#include "shape_string.hpp"
#include <sstream>

namespace util
{
    std::string shapeString(const std::vector<int64_t>& dims)
    {
        std::ostringstream os;
        os << '[';
        for (size_t i = 0; i < dims.size(); ++i)
        {
            if (dims[i] < 0) os << '?';
            else             os << dims[i];
            if (i + 1 != dims.size()) os << 'x';
        }
        os << ']';
        return os.str();
    }
}
