/*
 * Parser tests - TermCfg
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <termcfg/parse/parser.hpp>
#include <termcfg/parse/command.hpp>
#include <sstream>
#include <vector>

using namespace termcfg;

namespace {

// Keeps the stream alive for as long as the parser reads from it.
struct Input {
    explicit Input(const std::string& text, std::string source = "test") : in(text), parser(in, std::move(source)) {}
    std::istringstream in;
    ConfigParser parser;
};

template <typename T>
const T& expect_command(const ParseResult& r) {
    EXPECT_FALSE(r.error.has_value()) << (r.error ? r.error->str() : "");
    EXPECT_FALSE(r.eof);
    EXPECT_TRUE(r.command.has_value());
    static const T empty{};
    if (!r.command || !std::holds_alternative<T>(*r.command)) {
        ADD_FAILURE() << "unexpected command variant";
        return empty;
    }
    return std::get<T>(*r.command);
}

} // namespace

TEST(ParserCommands, QuitAndRemoveTab) {
    Input a("q");
    expect_command<QuitCommand>(a.parser.parse());
    Input b("rmtab");
    expect_command<RemoveTabCommand>(b.parser.parse());
}

TEST(ParserCommands, Set) {
    Input in("set foo bar");
    auto r = in.parser.parse();
    auto &set = expect_command<SetCommand>(r);
    EXPECT_EQ(set.variable.text, "foo");
    EXPECT_EQ(set.value.text, "bar");
    EXPECT_EQ(set.value.pos.column, 9u);
}

TEST(ParserCommands, MapUnmapAddTab) {
    Input in("map main <C-n> j\nunmap main <C-n>\naddtab \"My Tab\"\n");
    auto r1 = in.parser.parse();
    auto &m = expect_command<MapCommand>(r1);
    EXPECT_EQ(m.view.text, "main");
    EXPECT_EQ(m.from.text, "<C-n>");
    EXPECT_EQ(m.to.text, "j");
    auto r2 = in.parser.parse();
    auto &u = expect_command<UnmapCommand>(r2);
    EXPECT_EQ(u.view.text, "main");
    EXPECT_EQ(u.from.text, "<C-n>");
    EXPECT_EQ(u.from.pos.line, 2u);
    auto r3 = in.parser.parse();
    auto &t = expect_command<NewTabCommand>(r3);
    EXPECT_EQ(t.tab_name.text, "My Tab");
    auto end = in.parser.parse();
    EXPECT_TRUE(end.eof);
    EXPECT_FALSE(end.command.has_value());
    EXPECT_FALSE(end.error.has_value());
}

TEST(ParserTheme, OptionOrderDoesNotMatter) {
    Input in("theme --bgcolor 1 --name X --fgcolor 2 --component Y");
    auto r = in.parser.parse();
    auto &th = expect_command<ThemeCommand>(r);
    ASSERT_TRUE(th.name && th.component && th.bgcolor && th.fgcolor);
    EXPECT_EQ(th.name->text, "X");
    EXPECT_EQ(th.component->text, "Y");
    EXPECT_EQ(th.bgcolor->text, "1");
    EXPECT_EQ(th.fgcolor->text, "2");
}

TEST(ParserTheme, RepeatedOptionLastWriteWins) {
    Input in("theme --name A --name B --component C --bgcolor 1");
    auto r = in.parser.parse();
    auto &th = expect_command<ThemeCommand>(r);
    ASSERT_TRUE(th.name.has_value());
    EXPECT_EQ(th.name->text, "B");
    ASSERT_TRUE(th.component.has_value());
    EXPECT_EQ(th.component->text, "C");
    ASSERT_TRUE(th.bgcolor.has_value());
    EXPECT_EQ(th.bgcolor->text, "1");
    EXPECT_FALSE(th.fgcolor.has_value());
}

TEST(ParserTheme, UnknownOptionIsError) {
    Input in("theme --bogus X --name A --component C --bgcolor 1");
    auto r = in.parser.parse();
    EXPECT_FALSE(r.command.has_value());
    EXPECT_FALSE(r.eof);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Usage);
    EXPECT_EQ(r.error->str(), "test:1:7 Invalid option for theme command: \"--bogus\"");
}

TEST(ParserTheme, TooFewPairsIsUnexpectedEof) {
    Input in("theme --name A --component C");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::UnexpectedEof);
    EXPECT_TRUE(r.eof);
}

TEST(ParserTheme, ValueInOptionSlotIsGrammarError) {
    Input in("theme name A --component C --bgcolor 1 --fgcolor 2");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Grammar);
    EXPECT_EQ(r.error->str(), "test:1:7 Expected Option but got Word: \"name\"");
}

TEST(ParserVarArgs, AddViewWithArgs) {
    Input in("addview log --flag");
    auto r = in.parser.parse();
    auto &av = expect_command<AddViewCommand>(r);
    EXPECT_EQ(av.view.text, "log");
    ASSERT_EQ(av.args.size(), 1u);
    EXPECT_EQ(av.args[0].text, "--flag");
    EXPECT_EQ(av.args[0].kind, TokenKind::Option);
}

TEST(ParserVarArgs, AddViewWithoutViewIsUsageError) {
    Input in("addview");
    auto r = in.parser.parse();
    EXPECT_FALSE(r.command.has_value());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Usage);
    EXPECT_EQ(r.error->str(), "test:1:1 Invalid addview command. Usage: addview [VIEW] [ARGS...]");
    EXPECT_TRUE(in.parser.parse().eof);
}

TEST(ParserVarArgs, SplitOrientations) {
    Input in("split tree\nvsplit tree\nhsplit log a b\n");
    auto r1 = in.parser.parse();
    auto &s1 = expect_command<SplitViewCommand>(r1);
    EXPECT_EQ(s1.orientation, ContainerOrientation::Dynamic);
    EXPECT_EQ(s1.view.text, "tree");
    EXPECT_TRUE(s1.args.empty());
    auto r2 = in.parser.parse();
    EXPECT_EQ(expect_command<SplitViewCommand>(r2).orientation, ContainerOrientation::Vertical);
    auto r3 = in.parser.parse();
    auto &s3 = expect_command<SplitViewCommand>(r3);
    EXPECT_EQ(s3.orientation, ContainerOrientation::Horizontal);
    EXPECT_EQ(s3.view.text, "log");
    ASSERT_EQ(s3.args.size(), 2u);
    EXPECT_EQ(s3.args[1].text, "b");
}

TEST(ParserVarArgs, StopsAtSemicolon) {
    Input in("addview a b; q");
    auto r1 = in.parser.parse();
    auto &av = expect_command<AddViewCommand>(r1);
    ASSERT_EQ(av.args.size(), 1u);
    expect_command<QuitCommand>(in.parser.parse());
    EXPECT_TRUE(in.parser.parse().eof);
}

TEST(ParserInput, EmptyInput) {
    Input in("");
    auto r = in.parser.parse();
    EXPECT_TRUE(r.eof);
    EXPECT_FALSE(r.command.has_value());
    EXPECT_FALSE(r.error.has_value());
}

TEST(ParserInput, CommentsBlankLinesAndStrayTerminators) {
    Input in("# startup\n\n;;  set a b # trailing\n\n");
    auto r = in.parser.parse();
    auto &set = expect_command<SetCommand>(r);
    EXPECT_EQ(set.variable.text, "a");
    EXPECT_EQ(set.variable.pos.line, 3u);
    EXPECT_TRUE(in.parser.parse().eof);
}

TEST(ParserErrors, UnexpectedEofMidCommand) {
    Input in("set foo");
    auto r = in.parser.parse();
    EXPECT_FALSE(r.command.has_value());
    EXPECT_TRUE(r.eof);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::UnexpectedEof);
    EXPECT_EQ(r.error->str(), "test:1:8 Unexpected EOF");
}

TEST(ParserErrors, UnknownCommandIsCaseSensitive) {
    Input in("SET a b");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::UnknownCommand);
    EXPECT_EQ(r.error->str(), "test:1:1 Invalid command \"SET\"");
}

TEST(ParserErrors, OptionInCommandPosition) {
    Input in("--name x\nq\n");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Grammar);
    EXPECT_EQ(r.error->str(), "test:1:1 Unexpected Option \"--name\"");
    expect_command<QuitCommand>(in.parser.parse());
}

TEST(ParserErrors, LexicalErrorInArgument) {
    Input in("set x \"abc");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Syntax);
    EXPECT_EQ(r.error->str(), "test:1:7 Syntax Error: Unterminated string");
    EXPECT_FALSE(r.eof);
    EXPECT_TRUE(in.parser.parse().eof);
}

TEST(ParserErrors, InvalidTokenInCommandPosition) {
    Input in("\"abc");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->str(), "test:1:1 Syntax Error: Unterminated string");
}

TEST(ParserErrors, NoSourceLabel) {
    Input in("bogus", "");
    auto r = in.parser.parse();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->str(), "Invalid command \"bogus\"");
    EXPECT_EQ(in.parser.input_source(), "");
}

TEST(ParserState, InputSourceAccessor) {
    Input in("q", "~/.termcfgrc");
    EXPECT_EQ(in.parser.input_source(), "~/.termcfgrc");
}

TEST(ParserState, CommandsOutliveParser) {
    std::optional<Command> cmd;
    {
        Input in("set theme \"solarized dark\"");
        cmd = in.parser.parse().command;
    }
    ASSERT_TRUE(cmd.has_value());
    ASSERT_TRUE(std::holds_alternative<SetCommand>(*cmd));
    EXPECT_EQ(std::get<SetCommand>(*cmd).value.text, "solarized dark");
}

TEST(ParserState, CustomRegistry) {
    std::vector<CommandDescriptor> descriptors;
    descriptors.push_back({"quit", CommandKind::Quit, {}, false, build_quit, "quit"});
    CommandRegistry reg(std::move(descriptors));
    std::istringstream text("q\nquit\n");
    ConfigParser parser(std::make_unique<ConfigScanner>(text), "custom", reg);
    auto r1 = parser.parse();
    ASSERT_TRUE(r1.error.has_value());
    EXPECT_EQ(r1.error->str(), "custom:1:1 Invalid command \"q\"");
    expect_command<QuitCommand>(parser.parse());
}

TEST(ParserAll, CollectsCommandsAndErrorsInOrder) {
    Input in("set a b\nbogus 1 2\nmap x\naddtab t\nq\n");
    auto all = parse_all(in.parser);
    ASSERT_EQ(all.commands.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<SetCommand>(all.commands[0]));
    EXPECT_TRUE(std::holds_alternative<NewTabCommand>(all.commands[1]));
    EXPECT_TRUE(std::holds_alternative<QuitCommand>(all.commands[2]));
    ASSERT_EQ(all.errors.size(), 2u);
    EXPECT_EQ(all.errors[0].kind, ErrorKind::UnknownCommand);
    EXPECT_EQ(all.errors[1].kind, ErrorKind::Grammar);
}
