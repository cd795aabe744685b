#include "common/tty.hpp"

#ifdef __unix__
#include <unistd.h>
#endif

namespace mdlex {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return file != nullptr && isatty(fileno(file));
#else
    (void)file;
    return false;
#endif
}

const bool is_stdout_tty = is_tty(stdout);
const bool is_stderr_tty = is_tty(stderr);

} // namespace mdlex
