#pragma once

#include "../common/source_span.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace sigcheck::frontend
{
    using sigcheck::SourceLocation;
    using sigcheck::SourceSpan;

    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        IntegerLiteral,
        StringLiteral,
        Lifetime,
        DocComment,

        // Keywords
        KeywordImpl,
        KeywordModule,
        KeywordFunction,
        KeywordSelf,
        KeywordMutable,
        KeywordConstant,

        // Punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        LessThan,
        GreaterThan,
        Comma,
        Colon,
        PathSeparator,
        Semicolon,
        Dot,
        Arrow,
        Equals,
        Ampersand,
        Asterisk,
        Hash,
        Plus,
        Minus,
        Bang,
        Question
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace sigcheck::frontend
