#ifndef EDDY_STRING_UTILS_HEADER
#define EDDY_STRING_UTILS_HEADER

#include <cstdio>
#include <memory>
#include <string>

namespace eddy {
namespace util {

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

} // namespace util
} // namespace eddy

#endif // EDDY_STRING_UTILS_HEADER
