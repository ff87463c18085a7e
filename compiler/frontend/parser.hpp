#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <initializer_list>
#include <string_view>

namespace sigcheck::frontend
{
    class Parser
    {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view sourceName);

        [[nodiscard]] SourceFile parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& previous() const;
        const Token& advance();
        const Token& lookAhead(std::size_t offset) const;
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        const Token& consume(TokenKind kind, std::string_view messageCode, std::string_view messageText);
        void report(std::string_view code, std::string_view message, const SourceSpan& span);
        void synchronize();

        ItemBlock parseBlock(BlockKind kind);
        bool parseFunction(FunctionDeclaration& function);
        std::vector<Attribute> parseAttributes();
        Attribute parseAttribute();
        AttributeArgument parseAttributeArgument();
        std::vector<GenericParameter> parseGenericParameters();
        bool parseReceiver(Receiver& receiver);
        Parameter parseParameter();
        void skipBody(FunctionDeclaration& function);

        struct TypeCapture
        {
            std::string text;
            SourceSpan span{};
            TokenKind firstKind{TokenKind::EndOfFile};
            bool valid{false};
        };

        TypeCapture parseTypeUntil(std::initializer_list<TokenKind> terminators);

    private:
        const std::vector<Token>& m_tokens;
        std::string_view m_sourceName;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace sigcheck::frontend
