/*
 * TermCfg Parser Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares ConfigParser, which pulls tokens from a TokenSource and returns
 *   one Command (or one error) per call to parse(). After an error the parser
 *   discards input up to the next terminator so a malformed line does not
 *   affect the commands that follow it. Implementation resides in parser.cpp.
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
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "termcfg/lex/scanner.hpp"
#include "termcfg/parse/command.hpp"
#include "termcfg/parse/error.hpp"
#include "termcfg/parse/registry.hpp"

namespace termcfg {

struct ParseResult {
    std::optional<Command> command;
    bool eof = false; // input exhausted, stop calling parse()
    std::optional<ConfigError> error;
};

class ConfigParser {
public:
    ConfigParser(std::unique_ptr<TokenSource> scanner, std::string input_source,
                 const CommandRegistry& registry = CommandRegistry::defaults());
    // Scans the given stream with a ConfigScanner; the stream must outlive the parser.
    ConfigParser(std::istream& in, std::string input_source);

    ParseResult parse();
    const std::string& input_source() const { return m_input_source; }
private:
    std::optional<Token> scan(std::string& error);
    ParseResult parse_command(const Token& command);
    ParseResult parse_var_args_command(const CommandDescriptor& descriptor, const Token& command);
    ParseResult build(const CommandDescriptor& descriptor, const Token& command, std::vector<Token> tokens);
    ConfigError error_at(ErrorKind kind, const Token& token, std::string message) const;
    // true if the last token read ended a command (the failing token may itself be one)
    bool at_command_boundary() const;
    void discard_tokens_until_next_command();

    std::unique_ptr<TokenSource> m_scanner;
    std::string m_input_source;
    const CommandRegistry& m_registry;
    TokenKind m_last_kind = TokenKind::Terminator; // kind of the last significant token read
};

struct ParsedConfig {
    std::vector<Command> commands;
    std::vector<ConfigError> errors;
};

// Calls parse() until end of input (or a scanner failure) collecting everything.
ParsedConfig parse_all(ConfigParser& parser);

} // namespace termcfg
