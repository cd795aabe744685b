#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "common/io.hpp"

namespace mdlex {

namespace {

struct File_Closer {
    void operator()(std::FILE* f) const noexcept
    {
        std::fclose(f);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

} // namespace

std::string_view io_error_code_name(IO_Error_Code e) noexcept
{
    switch (e) {
    case IO_Error_Code::cannot_open: return "cannot_open";
    case IO_Error_Code::read_error: return "read_error";
    }
    return "";
}

Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory)
{
    // fopen needs a null-terminated path
    const std::string terminated_path { path };
    const Unique_File stream { std::fopen(terminated_path.c_str(), "rb") };
    if (!stream) {
        return { Error_Tag {}, IO_Error_Code::cannot_open };
    }

    constexpr Size block_size = 4096;
    char buffer[block_size];

    std::pmr::vector<char> out(memory);
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return { Error_Tag {}, IO_Error_Code::read_error };
        }
        out.insert(out.end(), buffer, buffer + read_size);
    } while (read_size == block_size);

    return { Success_Tag {}, std::move(out) };
}

} // namespace mdlex
