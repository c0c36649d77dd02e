/*
 * TermCfg Command Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines the closed family of configuration commands produced by the
 *   parser: set, theme, map, unmap, q, addtab, rmtab, addview and the split
 *   commands. Fields are Token copies, not resolved values, so the executor
 *   can still report errors at the original source position.
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
#include <variant>
#include "termcfg/lex/token.hpp"

namespace termcfg {

enum class ContainerOrientation { Dynamic, Horizontal, Vertical };

const char* orientation_name(ContainerOrientation o);

// set VAR VALUE
struct SetCommand {
    Token variable;
    Token value;
};

// theme --name N --component C --bgcolor B --fgcolor F
struct ThemeCommand {
    std::optional<Token> name;
    std::optional<Token> component;
    std::optional<Token> bgcolor;
    std::optional<Token> fgcolor;
};

// map VIEW FROM TO
struct MapCommand {
    Token view;
    Token from;
    Token to;
};

// unmap VIEW FROM
struct UnmapCommand {
    Token view;
    Token from;
};

struct QuitCommand {};

// addtab NAME
struct NewTabCommand {
    Token tab_name;
};

struct RemoveTabCommand {};

// addview VIEW [ARGS...]
struct AddViewCommand {
    Token view;
    std::vector<Token> args;
};

// split|hsplit|vsplit VIEW [ARGS...]
struct SplitViewCommand {
    ContainerOrientation orientation = ContainerOrientation::Dynamic;
    Token view;
    std::vector<Token> args;
};

using Command = std::variant<
    SetCommand,
    ThemeCommand,
    MapCommand,
    UnmapCommand,
    QuitCommand,
    NewTabCommand,
    RemoveTabCommand,
    AddViewCommand,
    SplitViewCommand>;

// Keyword the command is written with (split commands derive it from the orientation).
std::string command_name(const Command& cmd);

// Canonical one line rendering, values re-quoted where needed.
std::string describe(const Command& cmd);

// Minimal JSON rendering with token positions (hand-written, no external lib).
std::string to_json(const Command& cmd);

} // namespace termcfg
