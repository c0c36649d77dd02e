/*
 * TermCfg Grammar Registry
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Maps every command keyword to its grammar descriptor: either a fixed,
 *   ordered list of expected token kinds or a variable-arity marker, plus the
 *   constructor that turns the matched tokens into a Command. The default
 *   registry is built once and never modified, so parsers on different
 *   threads can share it without locking.
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
#include <vector>
#include <optional>
#include <map>
#include "termcfg/lex/token.hpp"
#include "termcfg/parse/command.hpp"
#include "termcfg/parse/error.hpp"

namespace termcfg {

namespace commands {
inline constexpr char set[] = "set";
inline constexpr char theme[] = "theme";
inline constexpr char map[] = "map";
inline constexpr char unmap[] = "unmap";
inline constexpr char quit[] = "q";
inline constexpr char addtab[] = "addtab";
inline constexpr char rmtab[] = "rmtab";
inline constexpr char addview[] = "addview";
inline constexpr char vsplit[] = "vsplit";
inline constexpr char hsplit[] = "hsplit";
inline constexpr char split[] = "split";
} // namespace commands

enum class CommandKind { Set, Theme, Map, Unmap, Quit, AddTab, RemoveTab, AddView, SplitView };

// Outcome of a command constructor: exactly one of the two is set.
struct BuildResult {
    std::optional<Command> command;
    std::optional<ConfigError> error;
};

// source is the parser's input label, used for error positions.
using CommandConstructor = BuildResult (*)(const std::string& source, const Token& command, std::vector<Token> tokens);

struct CommandDescriptor {
    std::string name;
    CommandKind kind;
    std::vector<TokenKind> token_kinds; // expected argument kinds (fixed grammars)
    bool var_args = false;
    CommandConstructor build = nullptr;
    std::string usage;
};

class CommandRegistry {
public:
    explicit CommandRegistry(std::vector<CommandDescriptor> descriptors);

    // nullptr if name is not a registered command (names are case sensitive).
    const CommandDescriptor* find(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return m_descriptors.size(); }

    // Process wide registry with the built-in commands.
    static const CommandRegistry& defaults();
private:
    std::map<std::string, CommandDescriptor> m_descriptors;
};

BuildResult build_set(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_theme(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_map(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_unmap(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_quit(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_new_tab(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_remove_tab(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_add_view(const std::string& source, const Token& command, std::vector<Token> tokens);
BuildResult build_split_view(const std::string& source, const Token& command, std::vector<Token> tokens);

} // namespace termcfg
