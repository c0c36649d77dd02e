/*
 * TermCfg Parse Errors
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Structured diagnostics produced by the command parser. Every error keeps
 *   the input source label, the position of the offending token, the message
 *   and any lexical error the scanner attached to the token; str() renders
 *   them as "<source>:<line>:<col> <message>[: <lexical error>]".
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
#include <string>
#include "termcfg/lex/token.hpp"

namespace termcfg {

enum class ErrorKind {
    Scanner,        // the token source itself failed
    Syntax,         // scanner flagged the token as malformed
    UnknownCommand,
    Grammar,        // wrong token kind, or an option where a command was expected
    UnexpectedEof,
    Usage           // command specific argument errors
};

struct ConfigError {
    ErrorKind kind = ErrorKind::Syntax;
    std::string source;     // input source label, may be empty
    Position pos;
    std::string message;
    std::string lex_error;  // empty if the token carried none
    bool positioned = true; // false for scanner failures

    std::string str() const;
};

// Renders a diagnostic for token the same way ConfigError::str() does.
std::string format_config_error(const std::string& source, const Token& token, const std::string& message);

ConfigError make_config_error(ErrorKind kind, const std::string& source, const Token& token, std::string message);

ConfigError make_scanner_error(std::string message);

} // namespace termcfg
