#ifndef MDLEX_COMMON_TTY_HPP
#define MDLEX_COMMON_TTY_HPP

#include <cstdio>

namespace mdlex {

/// @brief Returns `true` if the given stream refers to a terminal, in which case diagnostics are
/// printed with ANSI colors.
/// Always `false` on platforms without `isatty`.
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

/// @brief `is_tty(stdout)`, computed once at startup.
extern const bool is_stdout_tty;
/// @brief `is_tty(stderr)`, computed once at startup.
extern const bool is_stderr_tty;

} // namespace mdlex

#endif
