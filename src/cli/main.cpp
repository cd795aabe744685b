#include <iostream>
#include <memory_resource>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "md/lex.hpp"

namespace mdlex {
namespace {

/// @brief Loads and lexes the whole file, or prints an error and returns `std::nullopt`.
std::optional<std::pmr::vector<md::Lexed_Line>> load_and_lex(std::string_view file,
                                                             std::pmr::memory_resource* memory)
{
    Result<std::pmr::vector<char>, IO_Error_Code> source_data = file_to_bytes(file, memory);
    if (!source_data) {
        Code_String out { memory };
        print_io_error(out, file, source_data.error());
        print_code_string(std::cerr, out, is_stderr_tty);
        return {};
    }
    const std::string_view source { source_data->data(), source_data->size() };
    return md::lex_lines(source, {}, memory);
}

int dump_tokens(std::string_view file, std::pmr::memory_resource* memory)
{
    const std::optional<std::pmr::vector<md::Lexed_Line>> lines = load_and_lex(file, memory);
    if (!lines) {
        return 1;
    }
    Code_String out { memory };
    for (const md::Lexed_Line& line : *lines) {
        print_tokens(out, line.tokens, line.line);
    }
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

int dump_lines(std::string_view file, std::pmr::memory_resource* memory)
{
    const std::optional<std::pmr::vector<md::Lexed_Line>> lines = load_and_lex(file, memory);
    if (!lines) {
        return 1;
    }
    Code_String out { memory };
    print_lines(out, *lines);
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "dump_tokens", "FILE", "Prints the tokens of every line of the Markdown file." },
    { "dump_lines", "FILE", "Prints the kind and token count of every line of the Markdown file." },
};

void print_help(std::string_view program_name)
{
    std::cout << ansi::black << "Usage: " << ansi::reset << program_name //
              << ansi::yellow << " COMMAND " //
              << ansi::h_green << "...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << ansi::yellow << help.name << " " //
                  << ansi::h_green << help.arguments << '\n' //
                  << "      " << ansi::reset << help.description << '\n';
    }
}

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.size() == 0 ? "mdlex" : args[0];

    if (args.size() < 3) {
        print_help(program_name);
        return 1;
    }

    std::pmr::unsynchronized_pool_resource memory;

    if (args[1] == "dump_tokens") {
        return dump_tokens(args[2], &memory);
    }
    else if (args[1] == "dump_lines") {
        return dump_lines(args[2], &memory);
    }
    else {
        std::cout << "Unknown command '" << args[1] << "'\n";
        print_help(program_name);
        return 1;
    }
} catch (const Assertion_Error& e) {
    Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
} catch (const std::exception& e) {
    Code_String out;
    out.append("Unhandled exception! ", Code_Span_Type::diagnostic_error_text);
    out.append("An exception with the following message has been raised:",
               Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    if (const std::string_view what = e.what(); !what.empty()) {
        out.append(what, Code_Span_Type::diagnostic_text);
    }
    out.append("\n\n");
    print_internal_error_notice(out);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
}

} // namespace
} // namespace mdlex

int main(int argc, const char** argv)
{
    return mdlex::main(argc, argv);
}
