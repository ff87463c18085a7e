#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sigcheck::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    class Lexer
    {
    public:
        explicit Lexer(std::string_view source, std::string_view sourceName = {});

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text);
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexString();
        void lexLifetime();
        void lexSlashOrComment();
        void emitSingle(TokenKind kind);
        void reportError(std::string_view code, std::string_view message, SourceLocation start);
        bool match(char expected);
        char peek() const;
        char peekNext() const;
        char advance();
        bool isAtEnd() const;

    private:
        std::string_view m_source;
        std::string_view m_sourceName;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
    };
} // namespace sigcheck::frontend
