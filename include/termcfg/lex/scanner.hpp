/*
 * TermCfg Scanner Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Provides lexical analysis for the configuration command language. The
 *   ConfigScanner pulls characters from an input stream and hands back one
 *   Token per call: words, --options, white space, # comments, terminators
 *   (newline or ';') and end-of-input markers. Quoting and escaping are
 *   resolved here so the parser only sees final token text.
 *
 * License (MIT):
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
#include <istream>
#include <optional>
#include <string>
#include "termcfg/lex/token.hpp"

namespace termcfg {

// Pull-based token producer consumed by the parser.
class TokenSource {
public:
    virtual ~TokenSource() = default;
    // Returns nullopt if the underlying input failed; error then holds the reason.
    virtual std::optional<Token> next(std::string& error) = 0;
};

class ConfigScanner : public TokenSource {
public:
    explicit ConfigScanner(std::istream& in);
    std::optional<Token> next(std::string& error) override;
private:
    int peek();
    int get();
    bool read_failed() const;
    Token lex_white_space();
    Token lex_comment();
    Token lex_word();

    std::istream& m_in;
    Position m_pos; // position of the next unread character
};

} // namespace termcfg
