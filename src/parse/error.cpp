/*
 * TermCfg Parse Errors Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <termcfg/parse/error.hpp>
#include <sstream>

namespace termcfg {

namespace {

std::string render(const std::string& source, const Position& pos, const std::string& message, const std::string& lex_error) {
    std::ostringstream oss;
    if (!source.empty()) oss << source << ':' << pos.line << ':' << pos.column << ' ';
    oss << message;
    if (!lex_error.empty()) oss << ": " << lex_error;
    return oss.str();
}

} // namespace

std::string ConfigError::str() const {
    if (!positioned) return message;
    return render(source, pos, message, lex_error);
}

std::string format_config_error(const std::string& source, const Token& token, const std::string& message) {
    return render(source, token.pos, message, token.lex_error.value_or(""));
}

ConfigError make_config_error(ErrorKind kind, const std::string& source, const Token& token, std::string message) {
    ConfigError err;
    err.kind = kind;
    err.source = source;
    err.pos = token.pos;
    err.message = std::move(message);
    err.lex_error = token.lex_error.value_or("");
    return err;
}

ConfigError make_scanner_error(std::string message) {
    ConfigError err;
    err.kind = ErrorKind::Scanner;
    err.message = std::move(message);
    err.positioned = false;
    return err;
}

} // namespace termcfg
