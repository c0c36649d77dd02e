/*
 * TermCfg Token helpers
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <termcfg/lex/token.hpp>

namespace termcfg {

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Word: return "Word";
        case TokenKind::Option: return "Option";
        case TokenKind::WhiteSpace: return "WhiteSpace";
        case TokenKind::Comment: return "Comment";
        case TokenKind::Terminator: return "Terminator";
        case TokenKind::Eof: return "EOF";
        case TokenKind::Invalid: return "Invalid";
    }
    return "Unknown";
}

} // namespace termcfg
