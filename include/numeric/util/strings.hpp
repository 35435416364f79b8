#ifndef NUMERIC_STRINGS_HPP
#define NUMERIC_STRINGS_HPP

#include <string_view>

namespace numeric {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

} // namespace numeric

#endif
