/*
 * TermCfg Command helpers
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Naming, canonical rendering and JSON output for Command values.
 */
#include <termcfg/parse/command.hpp>
#include <termcfg/parse/registry.hpp>
#include <cstdio>
#include <type_traits>

namespace termcfg {

namespace {

bool needs_quotes(const Token& t) {
    if (t.text.empty()) return true;
    if (t.kind == TokenKind::Word && t.text.rfind("--", 0) == 0) return true;
    if (t.text[0] == '#') return true;
    for (char c : t.text) {
        if (c==' '||c=='\t'||c=='\n'||c=='\r'||c==';'||c=='"'||c=='\\') return true;
    }
    return false;
}

std::string quote(const Token& t) {
    if (!needs_quotes(t)) return t.text;
    std::string out = "\"";
    for (char c : t.text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    out += "\"";
    return out;
}

std::string json_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string json_token(const Token& t) {
    return "{ \"text\": \"" + json_escape(t.text) + "\", \"line\": " + std::to_string(t.pos.line)
        + ", \"column\": " + std::to_string(t.pos.column) + " }";
}

std::string json_tokens(const std::vector<Token>& ts) {
    std::string out = "[";
    for (size_t i=0;i<ts.size();++i) { if (i) out += ", "; out += json_token(ts[i]); }
    out += "]";
    return out;
}

void append_args(std::string& out, const std::vector<Token>& args) {
    for (auto &a : args) { out += ' '; out += quote(a); }
}

} // namespace

const char* orientation_name(ContainerOrientation o) {
    switch (o) {
        case ContainerOrientation::Dynamic: return "Dynamic";
        case ContainerOrientation::Horizontal: return "Horizontal";
        case ContainerOrientation::Vertical: return "Vertical";
    }
    return "Unknown";
}

std::string command_name(const Command& cmd) {
    return std::visit([](auto &c)->std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, SetCommand>) return commands::set;
        else if constexpr (std::is_same_v<T, ThemeCommand>) return commands::theme;
        else if constexpr (std::is_same_v<T, MapCommand>) return commands::map;
        else if constexpr (std::is_same_v<T, UnmapCommand>) return commands::unmap;
        else if constexpr (std::is_same_v<T, QuitCommand>) return commands::quit;
        else if constexpr (std::is_same_v<T, NewTabCommand>) return commands::addtab;
        else if constexpr (std::is_same_v<T, RemoveTabCommand>) return commands::rmtab;
        else if constexpr (std::is_same_v<T, AddViewCommand>) return commands::addview;
        else {
            switch (c.orientation) {
                case ContainerOrientation::Horizontal: return commands::hsplit;
                case ContainerOrientation::Vertical: return commands::vsplit;
                default: return commands::split;
            }
        }
    }, cmd);
}

std::string describe(const Command& cmd) {
    std::string out = command_name(cmd);
    std::visit([&](auto &c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, SetCommand>) {
            out += ' ' + quote(c.variable) + ' ' + quote(c.value);
        } else if constexpr (std::is_same_v<T, ThemeCommand>) {
            auto opt = [&](const char* flag, const std::optional<Token>& v) {
                if (v) { out += ' '; out += flag; out += ' '; out += quote(*v); }
            };
            opt("--name", c.name);
            opt("--component", c.component);
            opt("--bgcolor", c.bgcolor);
            opt("--fgcolor", c.fgcolor);
        } else if constexpr (std::is_same_v<T, MapCommand>) {
            out += ' ' + quote(c.view) + ' ' + quote(c.from) + ' ' + quote(c.to);
        } else if constexpr (std::is_same_v<T, UnmapCommand>) {
            out += ' ' + quote(c.view) + ' ' + quote(c.from);
        } else if constexpr (std::is_same_v<T, NewTabCommand>) {
            out += ' ' + quote(c.tab_name);
        } else if constexpr (std::is_same_v<T, AddViewCommand> || std::is_same_v<T, SplitViewCommand>) {
            out += ' ' + quote(c.view);
            append_args(out, c.args);
        }
    }, cmd);
    return out;
}

std::string to_json(const Command& cmd) {
    std::string out = "{ \"command\": \"" + json_escape(command_name(cmd)) + "\"";
    std::visit([&](auto &c) {
        using T = std::decay_t<decltype(c)>;
        auto field = [&](const char* key, const Token& t) { out += ", \""; out += key; out += "\": " + json_token(t); };
        if constexpr (std::is_same_v<T, SetCommand>) {
            field("variable", c.variable); field("value", c.value);
        } else if constexpr (std::is_same_v<T, ThemeCommand>) {
            if (c.name) field("name", *c.name);
            if (c.component) field("component", *c.component);
            if (c.bgcolor) field("bgcolor", *c.bgcolor);
            if (c.fgcolor) field("fgcolor", *c.fgcolor);
        } else if constexpr (std::is_same_v<T, MapCommand>) {
            field("view", c.view); field("from", c.from); field("to", c.to);
        } else if constexpr (std::is_same_v<T, UnmapCommand>) {
            field("view", c.view); field("from", c.from);
        } else if constexpr (std::is_same_v<T, NewTabCommand>) {
            field("tab_name", c.tab_name);
        } else if constexpr (std::is_same_v<T, AddViewCommand>) {
            field("view", c.view); out += ", \"args\": " + json_tokens(c.args);
        } else if constexpr (std::is_same_v<T, SplitViewCommand>) {
            out += ", \"orientation\": \""; out += orientation_name(c.orientation); out += "\"";
            field("view", c.view); out += ", \"args\": " + json_tokens(c.args);
        }
    }, cmd);
    out += " }";
    return out;
}

} // namespace termcfg
