#ifndef MDLEX_MD_FWD_HPP
#define MDLEX_MD_FWD_HPP

#include "common/config.hpp"

namespace mdlex::md {

enum struct Token_Type : Default_Underlying;
enum struct Link_Attribute : Default_Underlying;
enum struct Line_Kind : Default_Underlying;

struct Token;
struct Link_Validator;
struct Lex_Options;
struct Lexed_Line;

} // namespace mdlex::md

#endif
