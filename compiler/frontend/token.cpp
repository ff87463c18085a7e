#include "token.hpp"

namespace sigcheck::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntegerLiteral: return "integerLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";
        case TokenKind::Lifetime: return "lifetime";
        case TokenKind::DocComment: return "docComment";

        case TokenKind::KeywordImpl: return "impl";
        case TokenKind::KeywordModule: return "module";
        case TokenKind::KeywordFunction: return "fn";
        case TokenKind::KeywordSelf: return "self";
        case TokenKind::KeywordMutable: return "mut";
        case TokenKind::KeywordConstant: return "const";

        case TokenKind::LeftBrace: return "{";
        case TokenKind::RightBrace: return "}";
        case TokenKind::LeftParen: return "(";
        case TokenKind::RightParen: return ")";
        case TokenKind::LeftBracket: return "[";
        case TokenKind::RightBracket: return "]";
        case TokenKind::LessThan: return "<";
        case TokenKind::GreaterThan: return ">";
        case TokenKind::Comma: return ",";
        case TokenKind::Colon: return ":";
        case TokenKind::PathSeparator: return "::";
        case TokenKind::Semicolon: return ";";
        case TokenKind::Dot: return ".";
        case TokenKind::Arrow: return "->";
        case TokenKind::Equals: return "=";
        case TokenKind::Ampersand: return "&";
        case TokenKind::Asterisk: return "*";
        case TokenKind::Hash: return "#";
        case TokenKind::Plus: return "+";
        case TokenKind::Minus: return "-";
        case TokenKind::Bang: return "!";
        case TokenKind::Question: return "?";
        }

        return "unknown";
    }
} // namespace sigcheck::frontend
