/*
 * TermCfg Grammar Registry Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Built-in command descriptors and command constructors.
 */
#include <termcfg/parse/registry.hpp>
#include <iterator>
#include <sstream>
#include <utility>

namespace termcfg {

namespace {

BuildResult ok(Command cmd) { return BuildResult{std::move(cmd), std::nullopt}; }

BuildResult fail(ConfigError err) { return BuildResult{std::nullopt, std::move(err)}; }

BuildResult usage_error(const std::string& source, const Token& command, const std::string& usage) {
    std::ostringstream oss;
    oss << "Invalid " << command.text << " command. Usage: " << usage;
    return fail(make_config_error(ErrorKind::Usage, source, command, oss.str()));
}

// Fixed grammar constructors are only handed complete token lists by the
// parser; direct callers passing fewer tokens get a usage error.
bool short_of(const std::vector<Token>& tokens, std::size_t n) { return tokens.size() < n; }

std::vector<TokenKind> theme_token_kinds() {
    std::vector<TokenKind> kinds;
    for (int i=0;i<4;++i) { kinds.push_back(TokenKind::Option); kinds.push_back(TokenKind::Word); }
    return kinds;
}

std::vector<CommandDescriptor> builtin_descriptors() {
    using K = TokenKind;
    return {
        {commands::set, CommandKind::Set, {K::Word, K::Word}, false, build_set, "set VARIABLE VALUE"},
        {commands::theme, CommandKind::Theme, theme_token_kinds(), false, build_theme,
            "theme --name NAME --component COMPONENT --bgcolor BGCOLOR --fgcolor FGCOLOR"},
        {commands::map, CommandKind::Map, {K::Word, K::Word, K::Word}, false, build_map, "map VIEW FROM TO"},
        {commands::unmap, CommandKind::Unmap, {K::Word, K::Word}, false, build_unmap, "unmap VIEW FROM"},
        {commands::quit, CommandKind::Quit, {}, false, build_quit, "q"},
        {commands::addtab, CommandKind::AddTab, {K::Word}, false, build_new_tab, "addtab NAME"},
        {commands::rmtab, CommandKind::RemoveTab, {}, false, build_remove_tab, "rmtab"},
        {commands::addview, CommandKind::AddView, {}, true, build_add_view, "addview VIEW [ARGS...]"},
        {commands::vsplit, CommandKind::SplitView, {}, true, build_split_view, "vsplit VIEW [ARGS...]"},
        {commands::hsplit, CommandKind::SplitView, {}, true, build_split_view, "hsplit VIEW [ARGS...]"},
        {commands::split, CommandKind::SplitView, {}, true, build_split_view, "split VIEW [ARGS...]"},
    };
}

} // namespace

CommandRegistry::CommandRegistry(std::vector<CommandDescriptor> descriptors) {
    for (auto &d : descriptors) {
        std::string key = d.name;
        m_descriptors.insert_or_assign(std::move(key), std::move(d));
    }
}

const CommandDescriptor* CommandRegistry::find(const std::string& name) const {
    auto it = m_descriptors.find(name);
    if (it == m_descriptors.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> out;
    for (auto &[name, d] : m_descriptors) out.push_back(name);
    return out;
}

const CommandRegistry& CommandRegistry::defaults() {
    static const CommandRegistry registry(builtin_descriptors());
    return registry;
}

BuildResult build_set(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (short_of(tokens, 2)) return usage_error(source, command, "set VARIABLE VALUE");
    return ok(SetCommand{std::move(tokens[0]), std::move(tokens[1])});
}

BuildResult build_theme(const std::string& source, const Token&, std::vector<Token> tokens) {
    ThemeCommand theme;
    using Setter = std::optional<Token> ThemeCommand::*;
    static const std::map<std::string, Setter> option_setters = {
        {"--name", &ThemeCommand::name},
        {"--component", &ThemeCommand::component},
        {"--bgcolor", &ThemeCommand::bgcolor},
        {"--fgcolor", &ThemeCommand::fgcolor},
    };
    for (std::size_t i=0; i+1<tokens.size(); i+=2) {
        const Token& option = tokens[i];
        auto it = option_setters.find(option.text);
        if (it == option_setters.end()) {
            std::ostringstream oss;
            oss << "Invalid option for theme command: \"" << option.text << "\"";
            return fail(make_config_error(ErrorKind::Usage, source, option, oss.str()));
        }
        // a repeated option overwrites the earlier value
        theme.*(it->second) = std::move(tokens[i+1]);
    }
    return ok(std::move(theme));
}

BuildResult build_map(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (short_of(tokens, 3)) return usage_error(source, command, "map VIEW FROM TO");
    return ok(MapCommand{std::move(tokens[0]), std::move(tokens[1]), std::move(tokens[2])});
}

BuildResult build_unmap(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (short_of(tokens, 2)) return usage_error(source, command, "unmap VIEW FROM");
    return ok(UnmapCommand{std::move(tokens[0]), std::move(tokens[1])});
}

BuildResult build_quit(const std::string&, const Token&, std::vector<Token>) {
    return ok(QuitCommand{});
}

BuildResult build_new_tab(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (short_of(tokens, 1)) return usage_error(source, command, "addtab NAME");
    return ok(NewTabCommand{std::move(tokens[0])});
}

BuildResult build_remove_tab(const std::string&, const Token&, std::vector<Token>) {
    return ok(RemoveTabCommand{});
}

BuildResult build_add_view(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (tokens.empty()) return usage_error(source, command, command.text + " [VIEW] [ARGS...]");
    AddViewCommand cmd;
    cmd.view = std::move(tokens[0]);
    cmd.args.assign(std::make_move_iterator(tokens.begin()+1), std::make_move_iterator(tokens.end()));
    return ok(std::move(cmd));
}

BuildResult build_split_view(const std::string& source, const Token& command, std::vector<Token> tokens) {
    if (tokens.empty()) return usage_error(source, command, command.text + " [VIEW] [ARGS...]");
    SplitViewCommand cmd;
    if (command.text == commands::split) cmd.orientation = ContainerOrientation::Dynamic;
    else if (command.text == commands::hsplit) cmd.orientation = ContainerOrientation::Horizontal;
    else if (command.text == commands::vsplit) cmd.orientation = ContainerOrientation::Vertical;
    else {
        return fail(make_config_error(ErrorKind::UnknownCommand, source, command, "Unrecognised command: " + command.text));
    }
    cmd.view = std::move(tokens[0]);
    cmd.args.assign(std::make_move_iterator(tokens.begin()+1), std::make_move_iterator(tokens.end()));
    return ok(std::move(cmd));
}

} // namespace termcfg
