/*
 * TermCfg Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <termcfg/parse/parser.hpp>
#include <sstream>
#include <utility>

namespace termcfg {

namespace {

// Terminator text is a raw newline or ';', shown escaped in messages.
std::string display_text(const Token& token) {
    if (token.text == "\n") return "\\n";
    return token.text;
}

} // namespace

ConfigParser::ConfigParser(std::unique_ptr<TokenSource> scanner, std::string input_source, const CommandRegistry& registry)
    : m_scanner(std::move(scanner)), m_input_source(std::move(input_source)), m_registry(registry) {}

ConfigParser::ConfigParser(std::istream& in, std::string input_source)
    : ConfigParser(std::make_unique<ConfigScanner>(in), std::move(input_source)) {}

ParseResult ConfigParser::parse() {
    ParseResult result;
    while (true) {
        std::string scan_error;
        auto token = scan(scan_error);
        if (!token) {
            // broken input: report as is, nothing left to resynchronise on
            result.error = make_scanner_error(scan_error);
            return result;
        }
        switch (token->kind) {
            case TokenKind::Word:
                result = parse_command(*token);
                break;
            case TokenKind::Terminator:
                continue;
            case TokenKind::Eof:
                result.eof = true;
                break;
            case TokenKind::Option:
                result.error = error_at(ErrorKind::Grammar, *token, "Unexpected Option \"" + token->text + "\"");
                break;
            case TokenKind::Invalid:
                result.error = error_at(ErrorKind::Syntax, *token, "Syntax Error");
                break;
            default:
                result.error = error_at(ErrorKind::Grammar, *token, "Unexpected token \"" + token->text + "\"");
                break;
        }
        break;
    }
    if (result.error && result.error->kind != ErrorKind::Scanner && !at_command_boundary()) discard_tokens_until_next_command();
    return result;
}

std::optional<Token> ConfigParser::scan(std::string& error) {
    while (true) {
        auto token = m_scanner->next(error);
        if (!token) return std::nullopt;
        if (token->kind != TokenKind::WhiteSpace && token->kind != TokenKind::Comment) {
            m_last_kind = token->kind;
            return token;
        }
    }
}

ConfigError ConfigParser::error_at(ErrorKind kind, const Token& token, std::string message) const {
    return make_config_error(kind, m_input_source, token, std::move(message));
}

bool ConfigParser::at_command_boundary() const {
    return m_last_kind == TokenKind::Terminator || m_last_kind == TokenKind::Eof;
}

void ConfigParser::discard_tokens_until_next_command() {
    while (true) {
        std::string ignored;
        auto token = scan(ignored);
        if (!token || token->kind == TokenKind::Terminator || token->kind == TokenKind::Eof) return;
    }
}

ParseResult ConfigParser::parse_command(const Token& command) {
    ParseResult result;
    const CommandDescriptor* descriptor = m_registry.find(command.text);
    if (!descriptor) {
        result.error = error_at(ErrorKind::UnknownCommand, command, "Invalid command \"" + command.text + "\"");
        return result;
    }
    if (descriptor->var_args) return parse_var_args_command(*descriptor, command);

    std::vector<Token> tokens;
    for (TokenKind expected : descriptor->token_kinds) {
        std::string scan_error;
        auto token = scan(scan_error);
        if (!token) { result.error = make_scanner_error(scan_error); return result; }
        if (token->lex_error) {
            result.error = error_at(ErrorKind::Syntax, *token, "Syntax Error");
            return result;
        }
        if (token->kind == TokenKind::Eof) {
            result.error = error_at(ErrorKind::UnexpectedEof, *token, "Unexpected EOF");
            result.eof = true;
            return result;
        }
        if (token->kind != expected) {
            std::ostringstream oss;
            oss << "Expected " << token_kind_name(expected) << " but got " << token_kind_name(token->kind)
                << ": \"" << display_text(*token) << "\"";
            result.error = error_at(ErrorKind::Grammar, *token, oss.str());
            return result;
        }
        tokens.push_back(std::move(*token));
    }
    return build(*descriptor, command, std::move(tokens));
}

ParseResult ConfigParser::parse_var_args_command(const CommandDescriptor& descriptor, const Token& command) {
    ParseResult result;
    std::vector<Token> tokens;
    while (true) {
        std::string scan_error;
        auto token = scan(scan_error);
        if (!token) { result.error = make_scanner_error(scan_error); return result; }
        if (token->lex_error) {
            result.error = error_at(ErrorKind::Syntax, *token, "Syntax Error");
            return result;
        }
        // the terminator is consumed, end of input is sticky
        if (token->kind == TokenKind::Eof || token->kind == TokenKind::Terminator) break;
        tokens.push_back(std::move(*token));
    }
    return build(descriptor, command, std::move(tokens));
}

ParseResult ConfigParser::build(const CommandDescriptor& descriptor, const Token& command, std::vector<Token> tokens) {
    ParseResult result;
    auto built = descriptor.build(m_input_source, command, std::move(tokens));
    result.command = std::move(built.command);
    result.error = std::move(built.error);
    return result;
}

ParsedConfig parse_all(ConfigParser& parser) {
    ParsedConfig out;
    while (true) {
        auto r = parser.parse();
        if (r.command) out.commands.push_back(std::move(*r.command));
        if (r.error) {
            bool broken = r.error->kind == ErrorKind::Scanner;
            out.errors.push_back(std::move(*r.error));
            if (broken) break;
        }
        if (r.eof) break;
    }
    return out;
}

} // namespace termcfg
