#include "lexer.hpp"

#include <cctype>

namespace
{
    using namespace sigcheck::frontend;

    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "impl") return TokenKind::KeywordImpl;
        if (text == "module") return TokenKind::KeywordModule;
        if (text == "fn") return TokenKind::KeywordFunction;
        if (text == "self") return TokenKind::KeywordSelf;
        if (text == "mut") return TokenKind::KeywordMutable;
        if (text == "const") return TokenKind::KeywordConstant;
        return TokenKind::Identifier;
    }
} // namespace

namespace sigcheck::frontend
{
    Lexer::Lexer(std::string_view source, std::string_view sourceName)
        : m_source(source)
        , m_sourceName(sourceName)
        , m_location{1, 1}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = {1, 1};

        while (!isAtEnd())
        {
            const char ch = peek();
            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                advance();
                continue;
            }

            const SourceLocation startLocation = m_location;

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '"':
                lexString();
                break;
            case '\'':
                lexLifetime();
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                break;
            case '(':
                emitSingle(TokenKind::LeftParen);
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                break;
            case '[':
                emitSingle(TokenKind::LeftBracket);
                break;
            case ']':
                emitSingle(TokenKind::RightBracket);
                break;
            case '<':
                emitSingle(TokenKind::LessThan);
                break;
            case '>':
                emitSingle(TokenKind::GreaterThan);
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ':':
                advance();
                if (match(':'))
                {
                    pushToken(TokenKind::PathSeparator, startLocation, m_location, "::");
                }
                else
                {
                    pushToken(TokenKind::Colon, startLocation, m_location, ":");
                }
                break;
            case ';':
                emitSingle(TokenKind::Semicolon);
                break;
            case '.':
                emitSingle(TokenKind::Dot);
                break;
            case '-':
                advance();
                if (match('>'))
                {
                    pushToken(TokenKind::Arrow, startLocation, m_location, "->");
                }
                else
                {
                    pushToken(TokenKind::Minus, startLocation, m_location, "-");
                }
                break;
            case '=':
                emitSingle(TokenKind::Equals);
                break;
            case '&':
                emitSingle(TokenKind::Ampersand);
                break;
            case '*':
                emitSingle(TokenKind::Asterisk);
                break;
            case '#':
                emitSingle(TokenKind::Hash);
                break;
            case '+':
                emitSingle(TokenKind::Plus);
                break;
            case '!':
                emitSingle(TokenKind::Bang);
                break;
            case '?':
                emitSingle(TokenKind::Question);
                break;
            case '/':
                lexSlashOrComment();
                break;
            default:
                advance();
                reportError("SIGCHECK-E1000", "Unexpected character in source.", startLocation);
                break;
            }
        }

        const SourceLocation eofLocation = m_location;
        pushToken(TokenKind::EndOfFile, eofLocation, eofLocation, "");
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, end};
        token.text = std::string{text};
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startLocation, m_location, text);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first digit
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(TokenKind::IntegerLiteral, startLocation, m_location, text);
    }

    void Lexer::lexString()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume opening quote
        bool closed = false;
        while (!isAtEnd())
        {
            const char ch = advance();
            if (ch == '"')
            {
                closed = true;
                break;
            }
            if (ch == '\\' && !isAtEnd())
            {
                advance(); // skip escaped char
            }
        }

        if (!closed)
        {
            reportError("SIGCHECK-E1001", "Unterminated string literal.", startLocation);
            return;
        }

        const std::string_view text = m_source.substr(startIndex + 1, (m_current - startIndex) - 2);
        pushToken(TokenKind::StringLiteral, startLocation, m_location, text);
    }

    void Lexer::lexLifetime()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume apostrophe
        if (!isIdentifierStart(peek()))
        {
            reportError("SIGCHECK-E1003", "Expected lifetime name after apostrophe.", startLocation);
            return;
        }

        while (isIdentifierPart(peek()))
        {
            advance();
        }

        if (peek() == '\'')
        {
            advance();
            reportError("SIGCHECK-E1003", "Character literals are not supported in declarations.", startLocation);
            return;
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(TokenKind::Lifetime, startLocation, m_location, text);
    }

    void Lexer::lexSlashOrComment()
    {
        const SourceLocation startLocation = m_location;
        advance(); // consume '/'

        if (match('/'))
        {
            // "///" is a doc comment, "////" is an ordinary comment again.
            const bool isDoc = peek() == '/' && peekNext() != '/';
            if (isDoc)
            {
                advance();
            }

            const std::size_t textStart = m_current;
            while (!isAtEnd() && peek() != '\n')
            {
                advance();
            }

            if (isDoc)
            {
                std::string_view text = m_source.substr(textStart, m_current - textStart);
                if (!text.empty() && text.front() == ' ')
                {
                    text.remove_prefix(1);
                }
                while (!text.empty() && (text.back() == '\r' || text.back() == ' '))
                {
                    text.remove_suffix(1);
                }
                pushToken(TokenKind::DocComment, startLocation, m_location, text);
            }
            return;
        }

        if (match('*'))
        {
            while (!isAtEnd())
            {
                if (peek() == '*' && peekNext() == '/')
                {
                    advance();
                    advance();
                    return;
                }
                advance();
            }

            reportError("SIGCHECK-E1002", "Unterminated block comment.", startLocation);
            return;
        }

        reportError("SIGCHECK-E1000", "Unexpected character in source.", startLocation);
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startLocation, m_location, m_source.substr(m_current - 1, 1));
    }

    void Lexer::reportError(std::string_view code, std::string_view message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    bool Lexer::match(char expected)
    {
        if (isAtEnd()) return false;
        if (m_source[m_current] != expected) return false;
        advance();
        return true;
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekNext() const
    {
        if (m_current + 1 >= m_source.size()) return '\0';
        return m_source[m_current + 1];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch == '\n')
        {
            ++m_location.line;
            m_location.column = 1;
        }
        else
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }
} // namespace sigcheck::frontend
