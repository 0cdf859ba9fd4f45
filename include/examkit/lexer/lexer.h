#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/lexer/token.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file lexer.h
 * @brief Tokenizer for the snippet language.
 */

namespace examkit::lexer
{

/** @brief Token vector (terminated by Eof) or the first lexical error. */
using LexResult = std::variant<std::vector<Token>, examkit::diag::Diagnostic>;

/** @brief Tokens keep views into `input`; the input must outlive them. */
[[nodiscard]] LexResult lex(std::string_view input);

/** @brief Decode a string literal lexeme (quotes included) into its value. */
[[nodiscard]] std::string unescape_string_literal(std::string_view lexeme);

} // namespace examkit::lexer
