#include "parser.hpp"

#include <algorithm>

namespace sigcheck::frontend
{
    namespace
    {
        bool isWordToken(TokenKind kind)
        {
            switch (kind)
            {
            case TokenKind::Identifier:
            case TokenKind::IntegerLiteral:
            case TokenKind::StringLiteral:
            case TokenKind::Lifetime:
            case TokenKind::KeywordImpl:
            case TokenKind::KeywordModule:
            case TokenKind::KeywordSelf:
            case TokenKind::KeywordMutable:
            case TokenKind::KeywordConstant:
            case TokenKind::KeywordFunction:
                return true;
            default:
                return false;
            }
        }

        bool isSpacedOperator(TokenKind kind)
        {
            return kind == TokenKind::Arrow || kind == TokenKind::Plus || kind == TokenKind::Equals;
        }

        bool isAttributeValue(TokenKind kind)
        {
            return kind == TokenKind::Identifier || kind == TokenKind::IntegerLiteral || kind == TokenKind::StringLiteral;
        }
    } // namespace

    Parser::Parser(const std::vector<Token>& tokens, std::string_view sourceName)
        : m_tokens(tokens)
        , m_sourceName(sourceName)
    {
    }

    SourceFile Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        SourceFile file{};
        file.name = std::string{m_sourceName};

        while (!isAtEnd())
        {
            if (match(TokenKind::KeywordImpl))
            {
                file.blocks.emplace_back(parseBlock(BlockKind::Impl));
                continue;
            }

            if (match(TokenKind::KeywordModule))
            {
                file.blocks.emplace_back(parseBlock(BlockKind::Module));
                continue;
            }

            report("SIGCHECK-E1100", "Expected 'impl' or 'module' block.", peek().span);
            advance();
            while (!isAtEnd() && !check(TokenKind::KeywordImpl) && !check(TokenKind::KeywordModule))
            {
                advance();
            }
        }

        return file;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current == 0 ? 0 : m_current - 1];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }
        return previous();
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return m_tokens.empty() || peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    const Token& Parser::consume(TokenKind kind, std::string_view messageCode, std::string_view messageText)
    {
        if (check(kind))
        {
            return advance();
        }

        report(messageCode, messageText, peek().span);
        if (!isAtEnd())
        {
            advance();
        }
        return previous();
    }

    void Parser::report(std::string_view code, std::string_view message, const SourceSpan& span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Parser::synchronize()
    {
        int depth = 0;
        while (!isAtEnd())
        {
            if (depth == 0
                && (check(TokenKind::KeywordFunction) || check(TokenKind::Hash) || check(TokenKind::DocComment)
                    || check(TokenKind::RightBrace)))
            {
                return;
            }

            const Token& token = advance();
            if (token.kind == TokenKind::LeftBrace)
            {
                ++depth;
            }
            else if (token.kind == TokenKind::RightBrace && depth > 0)
            {
                --depth;
            }
        }
    }

    ItemBlock Parser::parseBlock(BlockKind kind)
    {
        ItemBlock block{};
        block.kind = kind;
        const Token& keyword = previous();
        block.span = keyword.span;

        if (kind == BlockKind::Impl)
        {
            TypeCapture typeName = parseTypeUntil({TokenKind::LeftBrace});
            if (!typeName.valid)
            {
                report("SIGCHECK-E1101", "Expected type name after 'impl'.", peek().span);
            }
            block.name = typeName.text;
            block.nameSpan = typeName.span;
        }
        else
        {
            const Token& nameToken = consume(TokenKind::Identifier, "SIGCHECK-E1101", "Expected module name after 'module'.");
            block.name = nameToken.text;
            block.nameSpan = nameToken.span;
        }

        consume(TokenKind::LeftBrace, "SIGCHECK-E1102", "Expected '{' to open block.");

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            FunctionDeclaration function{};
            if (parseFunction(function))
            {
                block.functions.emplace_back(std::move(function));
            }
            else
            {
                synchronize();
            }
        }

        const Token& closing = consume(TokenKind::RightBrace, "SIGCHECK-E1103", "Expected '}' to close block.");
        block.span.end = closing.span.end;
        return block;
    }

    bool Parser::parseFunction(FunctionDeclaration& function)
    {
        std::optional<SourceSpan> leadingSpan;
        while (check(TokenKind::DocComment))
        {
            const Token& doc = advance();
            function.docLines.emplace_back(doc.text);
            if (!leadingSpan.has_value())
            {
                leadingSpan = doc.span;
            }
        }

        function.attributes = parseAttributes();
        if (!leadingSpan.has_value() && !function.attributes.empty())
        {
            leadingSpan = function.attributes.front().span;
        }

        if (!check(TokenKind::KeywordFunction))
        {
            report("SIGCHECK-E1104", "Expected 'fn' declaration.", peek().span);
            if (!isAtEnd() && !check(TokenKind::RightBrace))
            {
                advance();
            }
            return false;
        }

        const Token& keyword = advance();
        function.span = leadingSpan.value_or(keyword.span);

        if (!check(TokenKind::Identifier))
        {
            report("SIGCHECK-E1105", "Expected function name.", peek().span);
            return false;
        }
        const Token& nameToken = advance();
        function.name = nameToken.text;
        function.nameSpan = nameToken.span;

        if (match(TokenKind::LessThan))
        {
            function.genericParameters = parseGenericParameters();
        }

        const Token& openParen = consume(TokenKind::LeftParen, "SIGCHECK-E1106", "Expected '(' after function name.");
        function.signatureSpan = openParen.span;

        if (parseReceiver(function.receiver) && !check(TokenKind::RightParen))
        {
            consume(TokenKind::Comma, "SIGCHECK-E1108", "Expected ',' or ')' after receiver.");
        }

        while (!check(TokenKind::RightParen) && !isAtEnd())
        {
            if (check(TokenKind::KeywordSelf) || (check(TokenKind::Ampersand) && lookAhead(1).kind == TokenKind::KeywordSelf))
            {
                report("SIGCHECK-E1107", "Receiver 'self' must be the first parameter.", peek().span);
                while (!isAtEnd() && !check(TokenKind::Comma) && !check(TokenKind::RightParen))
                {
                    advance();
                }
            }
            else
            {
                function.parameters.emplace_back(parseParameter());
            }

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        const Token& closeParen = consume(TokenKind::RightParen, "SIGCHECK-E1108", "Expected ')' after parameters.");
        function.signatureSpan.end = closeParen.span.end;

        if (match(TokenKind::Arrow))
        {
            TypeCapture returnType = parseTypeUntil({TokenKind::Semicolon, TokenKind::LeftBrace});
            if (!returnType.valid)
            {
                report("SIGCHECK-E1109", "Expected return type after '->'.", peek().span);
            }
            else
            {
                function.returnType = returnType.text;
                function.returnTypeSpan = returnType.span;
            }
        }

        if (match(TokenKind::Semicolon))
        {
            function.span.end = previous().span.end;
        }
        else if (check(TokenKind::LeftBrace))
        {
            skipBody(function);
        }
        else
        {
            report("SIGCHECK-E1110", "Expected ';' or function body.", peek().span);
            function.span.end = previous().span.end;
        }

        return true;
    }

    std::vector<Attribute> Parser::parseAttributes()
    {
        std::vector<Attribute> attributes;
        while (check(TokenKind::Hash))
        {
            attributes.emplace_back(parseAttribute());
        }
        return attributes;
    }

    Attribute Parser::parseAttribute()
    {
        Attribute attribute{};
        const Token& hash = advance();
        attribute.span = hash.span;

        consume(TokenKind::LeftBracket, "SIGCHECK-E1120", "Expected '[' after '#'.");

        const Token& nameToken = consume(TokenKind::Identifier, "SIGCHECK-E1121", "Expected attribute identifier.");
        attribute.name = nameToken.text;
        attribute.nameSpan = nameToken.span;

        if (match(TokenKind::Equals))
        {
            if (isAttributeValue(peek().kind))
            {
                const Token& value = advance();
                attribute.assignedValue = value.text;
                attribute.assignedValueKind = value.kind;
                attribute.assignedValueSpan = value.span;
            }
            else
            {
                report("SIGCHECK-E1122", "Expected value after '=' in attribute.", peek().span);
            }
        }
        else if (match(TokenKind::LeftParen))
        {
            attribute.hasArgumentList = true;
            while (!check(TokenKind::RightParen) && !isAtEnd())
            {
                attribute.arguments.emplace_back(parseAttributeArgument());
                if (!match(TokenKind::Comma))
                {
                    break;
                }
            }
            consume(TokenKind::RightParen, "SIGCHECK-E1123", "Expected ')' after attribute arguments.");
        }

        const Token& closing = consume(TokenKind::RightBracket, "SIGCHECK-E1123", "Expected ']' after attribute.");
        attribute.span.end = closing.span.end;
        return attribute;
    }

    AttributeArgument Parser::parseAttributeArgument()
    {
        AttributeArgument argument{};

        if (!isAttributeValue(peek().kind))
        {
            report("SIGCHECK-E1124", "Expected attribute argument.", peek().span);
            if (!check(TokenKind::RightParen))
            {
                advance();
            }
            return argument;
        }

        const Token& first = advance();
        argument.span = first.span;

        if (first.kind == TokenKind::Identifier && match(TokenKind::Equals))
        {
            if (!isAttributeValue(peek().kind))
            {
                report("SIGCHECK-E1125", "Expected value after '=' in attribute argument.", peek().span);
                argument.name = first.text;
                return argument;
            }

            const Token& value = advance();
            argument.name = first.text;
            argument.value = value.text;
            argument.valueKind = value.kind;
            argument.valueSpan = value.span;
            argument.span.end = value.span.end;
            return argument;
        }

        argument.value = first.text;
        argument.valueKind = first.kind;
        argument.valueSpan = first.span;
        return argument;
    }

    std::vector<GenericParameter> Parser::parseGenericParameters()
    {
        std::vector<GenericParameter> parameters;

        while (!check(TokenKind::GreaterThan) && !isAtEnd())
        {
            GenericParameter parameter{};

            if (check(TokenKind::Lifetime))
            {
                const Token& lifetime = advance();
                parameter.form = GenericParameterForm::Lifetime;
                parameter.name = lifetime.text;
                parameter.span = lifetime.span;
            }
            else if (match(TokenKind::KeywordConstant))
            {
                const Token& keyword = previous();
                const Token& nameToken = consume(TokenKind::Identifier, "SIGCHECK-E1114", "Expected name after 'const'.");
                parameter.form = GenericParameterForm::Constant;
                parameter.name = nameToken.text;
                parameter.span = mergeSpans(keyword.span, nameToken.span);
            }
            else if (check(TokenKind::Identifier))
            {
                const Token& nameToken = advance();
                parameter.form = GenericParameterForm::Type;
                parameter.name = nameToken.text;
                parameter.span = nameToken.span;
            }
            else
            {
                report("SIGCHECK-E1114", "Expected generic parameter.", peek().span);
                advance();
                continue;
            }

            if (match(TokenKind::Colon))
            {
                TypeCapture bounds = parseTypeUntil({TokenKind::Comma, TokenKind::GreaterThan, TokenKind::Equals});
                parameter.bounds = bounds.text;
                if (bounds.valid)
                {
                    parameter.span = mergeSpans(parameter.span, bounds.span);
                }
            }

            if (match(TokenKind::Equals))
            {
                TypeCapture fallback = parseTypeUntil({TokenKind::Comma, TokenKind::GreaterThan});
                if (fallback.valid)
                {
                    parameter.span = mergeSpans(parameter.span, fallback.span);
                }
            }

            parameters.emplace_back(std::move(parameter));

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        consume(TokenKind::GreaterThan, "SIGCHECK-E1115", "Expected '>' to close generic parameters.");
        return parameters;
    }

    bool Parser::parseReceiver(Receiver& receiver)
    {
        std::size_t length = 0;
        ReceiverForm form = ReceiverForm::None;

        if (check(TokenKind::KeywordSelf))
        {
            length = 1;
            form = ReceiverForm::Value;
        }
        else if (check(TokenKind::KeywordMutable) && lookAhead(1).kind == TokenKind::KeywordSelf)
        {
            length = 2;
            form = ReceiverForm::Value;
        }
        else if (check(TokenKind::Ampersand))
        {
            std::size_t offset = 1;
            if (lookAhead(offset).kind == TokenKind::Lifetime)
            {
                ++offset;
            }

            bool isMutable = false;
            if (lookAhead(offset).kind == TokenKind::KeywordMutable)
            {
                isMutable = true;
                ++offset;
            }

            if (lookAhead(offset).kind != TokenKind::KeywordSelf)
            {
                return false;
            }

            length = offset + 1;
            form = isMutable ? ReceiverForm::MutableReference : ReceiverForm::Reference;
        }
        else
        {
            return false;
        }

        const Token& first = peek();
        for (std::size_t index = 1; index < length; ++index)
        {
            advance();
        }
        const Token& last = advance();

        receiver.form = form;
        receiver.span = mergeSpans(first.span, last.span);

        if (match(TokenKind::Colon))
        {
            report("SIGCHECK-E1111", "Typed receivers are not supported.", previous().span);
            (void)parseTypeUntil({TokenKind::Comma, TokenKind::RightParen});
        }

        return true;
    }

    Parameter Parser::parseParameter()
    {
        Parameter parameter{};

        match(TokenKind::KeywordMutable);
        // 'module' is only reserved at block level.
        if (!check(TokenKind::Identifier) && !check(TokenKind::KeywordModule))
        {
            report("SIGCHECK-E1112", "Expected parameter name.", peek().span);
            while (!isAtEnd() && !check(TokenKind::Comma) && !check(TokenKind::RightParen))
            {
                advance();
            }
            return parameter;
        }

        const Token& nameToken = advance();
        parameter.name = nameToken.text;
        parameter.nameSpan = nameToken.span;
        parameter.span = nameToken.span;

        consume(TokenKind::Colon, "SIGCHECK-E1112", "Expected ':' after parameter name.");

        TypeCapture type = parseTypeUntil({TokenKind::Comma, TokenKind::RightParen, TokenKind::Equals});
        if (!type.valid)
        {
            report("SIGCHECK-E1112", "Expected parameter type.", peek().span);
            return parameter;
        }

        parameter.typeName = type.text;
        parameter.typeSpan = type.span;
        parameter.typeIsImplTrait = type.firstKind == TokenKind::KeywordImpl;
        parameter.span = mergeSpans(parameter.span, type.span);

        if (match(TokenKind::Equals))
        {
            const bool negative = match(TokenKind::Minus);
            if (!isAttributeValue(peek().kind))
            {
                report("SIGCHECK-E1113", "Expected default value after '='.", peek().span);
                return parameter;
            }

            const Token& value = advance();
            parameter.defaultValue = negative ? "-" + value.text : value.text;
            parameter.span = mergeSpans(parameter.span, value.span);
        }

        return parameter;
    }

    void Parser::skipBody(FunctionDeclaration& function)
    {
        const Token& bodyStart = advance();
        function.hasBody = true;
        int depth = 1;
        SourceSpan bodySpan = bodyStart.span;

        while (!isAtEnd() && depth > 0)
        {
            const Token& token = advance();
            if (token.kind == TokenKind::LeftBrace)
            {
                ++depth;
            }
            else if (token.kind == TokenKind::RightBrace)
            {
                --depth;
                bodySpan.end = token.span.end;
            }
        }

        if (depth != 0)
        {
            report("SIGCHECK-E1116", "Unterminated function body.", bodyStart.span);
        }

        function.span.end = bodySpan.end;
    }

    Parser::TypeCapture Parser::parseTypeUntil(std::initializer_list<TokenKind> terminators)
    {
        TypeCapture capture{};
        bool lastWasWord = false;
        int angleDepth = 0;
        int nestingDepth = 0;

        while (!isAtEnd())
        {
            const Token& token = peek();
            const bool atTopLevel = angleDepth == 0 && nestingDepth == 0;
            if (atTopLevel && std::find(terminators.begin(), terminators.end(), token.kind) != terminators.end())
            {
                break;
            }

            if (token.kind == TokenKind::LeftBrace || token.kind == TokenKind::Semicolon)
            {
                if (nestingDepth == 0 || token.kind == TokenKind::LeftBrace)
                {
                    break;
                }
            }

            if ((token.kind == TokenKind::RightParen || token.kind == TokenKind::RightBracket) && nestingDepth == 0)
            {
                break;
            }

            const Token& consumed = advance();
            switch (consumed.kind)
            {
            case TokenKind::LessThan: ++angleDepth; break;
            case TokenKind::GreaterThan:
                if (angleDepth > 0)
                {
                    --angleDepth;
                }
                break;
            case TokenKind::LeftParen:
            case TokenKind::LeftBracket: ++nestingDepth; break;
            case TokenKind::RightParen:
            case TokenKind::RightBracket: --nestingDepth; break;
            default: break;
            }

            if (!capture.valid)
            {
                capture.span.begin = consumed.span.begin;
                capture.firstKind = consumed.kind;
            }

            const bool word = isWordToken(consumed.kind);
            if (isSpacedOperator(consumed.kind))
            {
                capture.text.append(" ");
                capture.text.append(consumed.text);
                capture.text.append(" ");
            }
            else if (consumed.kind == TokenKind::Comma || consumed.kind == TokenKind::Colon
                || consumed.kind == TokenKind::Semicolon)
            {
                capture.text.append(consumed.text);
                capture.text.append(" ");
            }
            else
            {
                if (word && lastWasWord)
                {
                    capture.text.push_back(' ');
                }
                capture.text.append(consumed.text);
            }

            capture.span.end = consumed.span.end;
            capture.valid = true;
            lastWasWord = word;
        }

        while (!capture.text.empty() && capture.text.back() == ' ')
        {
            capture.text.pop_back();
        }

        return capture;
    }
} // namespace sigcheck::frontend
