#ifndef NUMERIC_FUNCTION_REF_HPP
#define NUMERIC_FUNCTION_REF_HPP

#include <string_view>

#include "ulight/function_ref.hpp"

namespace numeric {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

/// @brief Receives text in pieces, such as the digits printed by `Big_Int::print_to`.
using String_Sink = Function_Ref<void(std::string_view)>;

/// @brief Like `String_Sink`, but for UTF-8 text.
using U8_String_Sink = Function_Ref<void(std::u8string_view)>;

} // namespace numeric

#endif
