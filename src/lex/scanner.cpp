/*
 * TermCfg Scanner Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts a character stream into Tokens (words, options,
 *              white space, comments, terminators). See header for details.
 */
#include <termcfg/lex/scanner.hpp>

namespace termcfg {

namespace {

constexpr int end_of_input = std::char_traits<char>::eof();

bool is_blank(int c) { return c==' ' || c=='\t' || c=='\r' || c=='\f' || c=='\v'; }
bool is_terminator(int c) { return c=='\n' || c==';'; }

} // namespace

ConfigScanner::ConfigScanner(std::istream& in) : m_in(in) {}

int ConfigScanner::peek() { return m_in.peek(); }

int ConfigScanner::get() {
    int c = m_in.get();
    if (c == end_of_input) return c;
    if (c == '\n') { ++m_pos.line; m_pos.column = 1; }
    else ++m_pos.column;
    return c;
}

bool ConfigScanner::read_failed() const { return m_in.bad(); }

Token ConfigScanner::lex_white_space() {
    Token t{TokenKind::WhiteSpace, "", m_pos, std::nullopt};
    while (is_blank(peek())) t.text.push_back(static_cast<char>(get()));
    return t;
}

Token ConfigScanner::lex_comment() {
    Token t{TokenKind::Comment, "", m_pos, std::nullopt};
    while (true) {
        int c = peek();
        if (c == end_of_input || c == '\n') break;
        t.text.push_back(static_cast<char>(get()));
    }
    return t;
}

Token ConfigScanner::lex_word() {
    Token t{TokenKind::Word, "", m_pos, std::nullopt};
    std::string raw; bool in_double = false;
    while (true) {
        int c = peek();
        if (c == end_of_input) break;
        if (!in_double) {
            if (is_blank(c) || is_terminator(c)) break;
            raw.push_back(static_cast<char>(get()));
            if (c == '"') { in_double = true; continue; }
            if (c == '\\') {
                int n = peek();
                if (n == end_of_input) { t.lex_error = "Incomplete escape sequence"; break; }
                raw.push_back(static_cast<char>(get()));
                t.text.push_back(static_cast<char>(n));
                continue;
            }
            t.text.push_back(static_cast<char>(c));
        } else {
            // a quoted segment never spans lines; the newline stays for the parser
            if (c == '\n') break;
            raw.push_back(static_cast<char>(get()));
            if (c == '"') { in_double = false; continue; }
            if (c == '\\') {
                int n = peek();
                if (n == end_of_input || n == '\n') break;
                raw.push_back(static_cast<char>(get()));
                switch (n) {
                    case '"': t.text.push_back('"'); break;
                    case '\\': t.text.push_back('\\'); break;
                    case 'n': t.text.push_back('\n'); break;
                    case 't': t.text.push_back('\t'); break;
                    default: t.text.push_back('\\'); t.text.push_back(static_cast<char>(n)); break;
                }
                continue;
            }
            t.text.push_back(static_cast<char>(c));
        }
    }
    if (in_double) t.lex_error = "Unterminated string";
    if (t.lex_error) { t.kind = TokenKind::Invalid; t.text = raw; }
    else if (raw.rfind("--", 0) == 0) t.kind = TokenKind::Option;
    return t;
}

std::optional<Token> ConfigScanner::next(std::string& error) {
    int c = peek();
    if (read_failed()) { error = "Failed to read input"; return std::nullopt; }
    Token t;
    if (c == end_of_input) t = Token{TokenKind::Eof, "", m_pos, std::nullopt};
    else if (is_blank(c)) t = lex_white_space();
    else if (is_terminator(c)) { t = Token{TokenKind::Terminator, "", m_pos, std::nullopt}; t.text.push_back(static_cast<char>(get())); }
    else if (c == '#') t = lex_comment();
    else t = lex_word();
    if (read_failed()) { error = "Failed to read input"; return std::nullopt; }
    return t;
}

} // namespace termcfg
