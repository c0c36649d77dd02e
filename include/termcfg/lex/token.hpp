/*
 * TermCfg Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines token kinds and the Token structure exchanged between the config
 *   scanner and the command parser. Tokens are plain value types: the parser
 *   copies them into command values so nothing refers back into scanner state.
 *
 * License (MIT): (see full text in scanner.hpp header or duplicate below)
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <cstddef>
#include <optional>

namespace termcfg {

enum class TokenKind {
    Word,
    Option,
    WhiteSpace,
    Comment,
    Terminator,
    Eof,
    Invalid
};

struct Position {
    std::size_t line = 1;   // 1-based
    std::size_t column = 1; // 1-based
};

struct Token {
    TokenKind kind = TokenKind::Invalid;
    std::string text;
    Position pos;
    std::optional<std::string> lex_error; // set on placeholder tokens for malformed input
};

// Display name used in diagnostics ("Word", "Option", "EOF", ...).
const char* token_kind_name(TokenKind kind);

} // namespace termcfg
