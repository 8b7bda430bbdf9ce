#include "util/ArgParse.hpp"

#include <stdexcept>

namespace alphapunch {
namespace util {

IntArgError parseIntArg(const std::string& text, int lo, int hi, int& out)
{
    long value = 0;
    std::size_t used = 0;
    try
    {
        value = std::stol(text, &used);
    }
    catch (const std::invalid_argument&)
    {
        return IntArgError::NotANumber;
    }
    catch (const std::out_of_range&)
    {
        return IntArgError::OutOfRange;
    }
    if (used != text.size()) return IntArgError::NotANumber;
    if (value < lo || value > hi) return IntArgError::OutOfRange;
    out = static_cast<int>(value);
    return IntArgError::None;
}

}
}
