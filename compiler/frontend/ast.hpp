#pragma once

#include "token.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigcheck::frontend
{
    struct AttributeArgument
    {
        std::string name;
        std::string value;
        TokenKind valueKind{TokenKind::Identifier};
        SourceSpan span;
        SourceSpan valueSpan;
    };

    struct Attribute
    {
        std::string name;
        SourceSpan nameSpan;
        std::optional<std::string> assignedValue;
        TokenKind assignedValueKind{TokenKind::StringLiteral};
        SourceSpan assignedValueSpan;
        bool hasArgumentList{false};
        std::vector<AttributeArgument> arguments;
        SourceSpan span;
    };

    enum class ReceiverForm
    {
        None,
        Reference,
        MutableReference,
        Value
    };

    struct Receiver
    {
        ReceiverForm form{ReceiverForm::None};
        SourceSpan span;
    };

    struct Parameter
    {
        std::string name;
        std::string typeName;
        bool typeIsImplTrait{false};
        std::optional<std::string> defaultValue;
        SourceSpan span;
        SourceSpan nameSpan;
        SourceSpan typeSpan;
    };

    enum class GenericParameterForm
    {
        Lifetime,
        Type,
        Constant
    };

    struct GenericParameter
    {
        GenericParameterForm form{GenericParameterForm::Type};
        std::string name;
        std::string bounds;
        SourceSpan span;
    };

    struct FunctionDeclaration
    {
        std::vector<std::string> docLines;
        std::vector<Attribute> attributes;
        std::string name;
        SourceSpan nameSpan;
        std::vector<GenericParameter> genericParameters;
        Receiver receiver;
        std::vector<Parameter> parameters;
        SourceSpan signatureSpan;
        std::optional<std::string> returnType;
        std::optional<SourceSpan> returnTypeSpan;
        bool hasBody{false};
        SourceSpan span;
    };

    enum class BlockKind
    {
        Impl,
        Module
    };

    struct ItemBlock
    {
        BlockKind kind{BlockKind::Impl};
        std::string name;
        SourceSpan nameSpan;
        std::vector<FunctionDeclaration> functions;
        SourceSpan span;
    };

    struct SourceFile
    {
        std::string name;
        std::vector<ItemBlock> blocks;
    };
} // namespace sigcheck::frontend
