#pragma once
#include <string>

namespace alphapunch {
namespace util {

enum class IntArgError
{
    None,
    NotANumber,
    OutOfRange
};

// Parse the whole of @p text as a base-10 int in [lo, hi]. @p out is written
// only on success.
IntArgError parseIntArg(const std::string& text, int lo, int hi, int& out);

}
}
