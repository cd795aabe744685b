#ifndef MDLEX_COMMON_CONFIG_HPP
#define MDLEX_COMMON_CONFIG_HPP

#include <cstddef>

namespace mdlex {

/// @brief Convenience alias for `std::size_t`.
/// All offsets into a line are byte offsets of this type.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define MDLEX_ENUM_STRING_CASE(...)                                                                \
    case __VA_ARGS__: return #__VA_ARGS__

} // namespace mdlex

#endif
