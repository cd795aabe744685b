#include <optional>
#include <variant>

#include "common/assert.hpp"
#include "common/unicode.hpp"
#include "common/visit.hpp"

#include "md/inline.hpp"
#include "md/link_details.hpp"
#include "md/link_validator.hpp"
#include "md/tidy.hpp"
#include "md/token.hpp"

namespace mdlex::md {

namespace {

// All offsets in the states below are byte offsets into the inline content.

struct Normal { };
/// The next character is taken literally.
struct Skip { };
/// Inside a run of `*`, `_`, or `` ` `` which started at `begin`.
struct Continuous {
    Size begin;
};
/// After `!`.
struct Image_Open {
    Size exclamation;
};
/// After `![`.
struct Image_Name_Open {
    Size exclamation;
    Size left_bracket;
};
/// After `[`.
struct Link_Name_Open {
    Size left_bracket;
};
/// After `[...]` or `![...]`.
struct Name_Closed {
    std::optional<Size> exclamation;
    Size left_bracket;
    Size right_bracket;
};
/// After `[...][`.
struct Reference_Open {
    Size left_bracket;
    Size right_bracket;
    Size tag_bracket;
};
/// After `[...]:`.
struct Definition_Open {
    Size left_bracket;
    Size right_bracket;
    Size colon;
};
/// After `[...](` or `![...](`.
struct Location_Open {
    std::optional<Size> exclamation;
    Size left_bracket;
    Size right_bracket;
    Size left_parenthesis;
};
/// After `<`.
struct Autolink_Open {
    Size left_angle;
};
/// The rest of the line has been consumed.
struct Terminal { };

using State = std::variant<Normal,
                           Skip,
                           Continuous,
                           Image_Open,
                           Image_Name_Open,
                           Link_Name_Open,
                           Name_Closed,
                           Reference_Open,
                           Definition_Open,
                           Location_Open,
                           Autolink_Open,
                           Terminal>;

[[nodiscard]] Token_Type delimiter_type(char c)
{
    switch (c) {
    case '*': return Token_Type::star;
    case '_': return Token_Type::underline;
    case '`': return Token_Type::back_tick;
    default: break;
    }
    MDLEX_ASSERT_UNREACHABLE("Not a delimiter character.");
}

[[nodiscard]] bool is_escapable(char c) noexcept
{
    return escapable_characters.find(c) != std::string_view::npos;
}

[[nodiscard]] std::string_view strip_newline(std::string_view str) noexcept
{
    return str.ends_with('\n') ? str.substr(0, str.length() - 1) : str;
}

struct Inline_Lexer {
private:
    std::pmr::vector<Token>& m_tokens;
    std::string_view m_content;
    const Link_Validator& m_validator;
    std::pmr::memory_resource* m_memory;
    /// @brief The begin of pending text which has not been emitted yet.
    Size m_last = 0;
    State m_state = Normal {};

public:
    [[nodiscard]] Inline_Lexer(std::pmr::vector<Token>& tokens,
                               std::string_view content,
                               const Link_Validator& validator)
        : m_tokens { tokens }
        , m_content { content }
        , m_validator { validator }
        , m_memory { tokens.get_allocator().resource() }
    {
    }

    void operator()()
    {
        for (Size i = 0; i < m_content.length();) {
            const Code_Point c = decode_utf8(m_content, i);
            if (c.value == U'\n') {
                flush_trailing_text(i);
                return;
            }
            if (std::holds_alternative<Terminal>(m_state)) {
                return;
            }
            if (std::holds_alternative<Skip>(m_state)) {
                m_state = Normal {};
                i += c.length;
                continue;
            }
            if (c.value == U'\\' && i + 1 < m_content.length() && is_escapable(m_content[i + 1])) {
                flush_text(i);
                m_last = i + 1;
                m_state = Skip {};
                i += c.length;
                continue;
            }

            fast_visit([this, i, c](auto& state) { step(state, i, c.value); }, m_state);
            i += c.length;
        }
        if (!std::holds_alternative<Terminal>(m_state)) {
            flush_trailing_text(m_content.length());
        }
    }

private:
    [[nodiscard]] std::string_view slice(Size begin, Size end) const
    {
        return m_content.substr(begin, end - begin);
    }

    void emit(std::string_view value, Token_Type type)
    {
        m_tokens.emplace_back(value, type, m_memory);
    }

    /// @brief Emits the pending text up to `end` as a `text` token, if there is any.
    void flush_text(Size end)
    {
        if (m_last < end) {
            emit(slice(m_last, end), Token_Type::text);
        }
    }

    /// @brief Like `flush_text`, but drops trailing whitespace and `<br>` markers, which are
    /// represented by a `line_break` token instead.
    void flush_trailing_text(Size end)
    {
        if (m_last >= end) {
            return;
        }
        std::string_view text = trim_end(slice(m_last, end));
        while (text.ends_with("<br>")) {
            text.remove_suffix(4);
        }
        if (!text.empty()) {
            emit(text, Token_Type::text);
        }
        m_last = end;
    }

    [[nodiscard]] char next_byte(Size i) const noexcept
    {
        return i + 1 < m_content.length() ? m_content[i + 1] : '\0';
    }

    void step(Normal&, Size i, char32_t c)
    {
        switch (c) {
        case U'*':
        case U'_':
        case U'`': {
            flush_text(i);
            m_last = i;
            if (next_byte(i) == m_content[i]) {
                m_state = Continuous { i };
            }
            else {
                emit(slice(i, i + 1), delimiter_type(m_content[i]));
                m_last = i + 1;
            }
            break;
        }
        case U'!': m_state = Image_Open { i }; break;
        case U'[': m_state = Link_Name_Open { i }; break;
        case U'<': m_state = Autolink_Open { i }; break;
        default: break;
        }
    }

    void step(Skip&, Size, char32_t)
    {
        MDLEX_ASSERT_UNREACHABLE("Skipped characters are handled before dispatch.");
    }

    void step(Continuous& state, Size i, char32_t)
    {
        if (next_byte(i) != m_content[i]) {
            emit(slice(state.begin, i + 1), delimiter_type(m_content[i]));
            m_last = i + 1;
            m_state = Normal {};
        }
    }

    void step(Image_Open& state, Size i, char32_t c)
    {
        // A character other than `[` or `!` stays part of the pending text.
        switch (c) {
        case U'[': m_state = Image_Name_Open { state.exclamation, i }; break;
        case U'!': m_state = Image_Open { i }; break;
        default: m_state = Normal {}; break;
        }
    }

    void step(Image_Name_Open& state, Size i, char32_t c)
    {
        if (c == U']') {
            m_state = Name_Closed { state.exclamation, state.left_bracket, i };
        }
    }

    void step(Link_Name_Open& state, Size i, char32_t c)
    {
        if (c == U']') {
            m_state = Name_Closed { std::nullopt, state.left_bracket, i };
        }
        else if (c == U'[') {
            state.left_bracket = i;
        }
    }

    void step(Name_Closed& state, Size i, char32_t c)
    {
        switch (c) {
        case U'(':
            m_state = Location_Open { state.exclamation, state.left_bracket, state.right_bracket,
                                      i };
            break;
        case U'[':
            m_state = Reference_Open { state.left_bracket, state.right_bracket, i };
            break;
        case U':':
            m_state = Definition_Open { state.left_bracket, state.right_bracket, i };
            break;
        case U']': state.right_bracket = i; break;
        default: m_state = Normal {}; break;
        }
    }

    void step(Reference_Open& state, Size i, char32_t c)
    {
        if (c == U']') {
            flush_text(state.left_bracket);
            m_tokens.push_back(make_link_token(slice(state.left_bracket, i + 1),
                                               slice(state.left_bracket + 1, state.right_bracket),
                                               slice(state.tag_bracket + 1, i),
                                               Token_Type::ref_link, m_memory));
            m_last = i + 1;
            m_state = Normal {};
        }
    }

    /// The definition takes the rest of the line, including pending text before the `[`.
    void step(Definition_Open& state, Size i, char32_t)
    {
        const Size end = m_content.length();
        m_tokens.push_back(make_link_token(strip_newline(slice(m_last, end)),
                                           slice(state.left_bracket + 1, state.right_bracket),
                                           strip_newline(slice(i, end)), Token_Type::ref_link_def,
                                           m_memory));
        m_last = end;
        m_state = Terminal {};
    }

    void step(Location_Open& state, Size i, char32_t c)
    {
        if (c == U')') {
            const Size begin = state.exclamation.value_or(state.left_bracket);
            const Token_Type type = state.exclamation ? Token_Type::image : Token_Type::link;
            flush_text(begin);
            m_tokens.push_back(make_link_token(slice(begin, i + 1),
                                               slice(state.left_bracket + 1, state.right_bracket),
                                               slice(state.left_parenthesis + 1, i), type,
                                               m_memory));
            m_last = i + 1;
            m_state = Normal {};
        }
    }

    void step(Autolink_Open& state, Size i, char32_t c)
    {
        if (is_unicode_whitespace(c)) {
            const std::string_view partial = trim(slice(state.left_angle + 1, i));
            if (!partial.empty() && !m_validator.is_autolink(partial)) {
                m_state = Normal {};
            }
        }
        else if (c == U'>') {
            const std::string_view link = trim(slice(state.left_angle + 1, i));
            if (m_validator.is_autolink(link)) {
                flush_text(state.left_angle);
                m_tokens.push_back(make_link_token(slice(state.left_angle, i + 1), link, link,
                                                   Token_Type::quick_link, m_memory));
                m_last = i + 1;
            }
            m_state = Normal {};
        }
    }

    void step(Terminal&, Size, char32_t)
    {
        MDLEX_ASSERT_UNREACHABLE("The terminal state is handled before dispatch.");
    }
};

} // namespace

bool has_line_break(std::string_view content)
{
    return content.ends_with("  \n") || trim_end(content).ends_with("<br>");
}

void tokenize_inline(std::pmr::vector<Token>& out,
                     std::string_view content,
                     const Link_Validator& validator)
{
    std::pmr::vector<Token> tokens(out.get_allocator().resource());
    Inline_Lexer { tokens, content, validator }();
    if (has_line_break(content)) {
        tokens.emplace_back("<br>", Token_Type::line_break, out.get_allocator().resource());
    }
    tidy(tokens);

    for (Token& token : tokens) {
        if (!token.empty()) {
            out.push_back(std::move(token));
        }
    }
}

} // namespace mdlex::md
