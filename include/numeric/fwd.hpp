#ifndef NUMERIC_FWD_HPP
#define NUMERIC_FWD_HPP

#include <cstddef>

#include "numeric/settings.hpp"

NUMERIC_IF_DEBUG() // silence unused warning for settings.hpp

namespace numeric {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define NUMERIC_ENUM_STRING_CASE8(...)                                                             \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Big_Int;
struct Collected_Diagnostic;
struct Collecting_Logger;
struct Diagnostic;
enum struct From_String_Error_Kind : Default_Underlying;
struct From_String_Error;
struct Ignorant_Logger;
template <typename>
struct Interner;
enum struct Interner_Id : std::size_t;
struct Interner_Options;
template <typename, std::size_t>
struct Linked_Chunks;
struct Logger;
enum struct Out_Of_Range_Error : Default_Underlying;
template <typename T, typename E>
struct Result;
enum struct Severity : Default_Underlying;
struct Spin_Lock;
template <typename>
struct Word_Traits;

/// @brief The word type in which `Big_Int` stores its magnitude.
using Big_Int_Word = std::size_t;

} // namespace numeric

#endif
