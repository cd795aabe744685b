#ifndef MDLEX_COMMON_IO_HPP
#define MDLEX_COMMON_IO_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "common/config.hpp"
#include "common/result.hpp"

namespace mdlex {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file could not be opened, e.g. because it does not exist.
    cannot_open,
    /// @brief The file was opened, but reading from it failed.
    read_error,
};

[[nodiscard]] std::string_view io_error_code_name(IO_Error_Code e) noexcept;

/// @brief Reads the whole file at `path` into a vector of bytes.
/// @param path the file path
/// @param memory the memory resource used by the returned vector
/// @return The file contents, or the reason why they could not be read.
Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory);

} // namespace mdlex

#endif
