#include "declaration_builder.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace sigcheck::methods
{
    namespace
    {
        using sigcheck::frontend::TokenKind;

        bool isIdentifier(std::string_view text)
        {
            if (text.empty())
            {
                return false;
            }

            const unsigned char first = static_cast<unsigned char>(text.front());
            if (std::isalpha(first) == 0 && first != '_')
            {
                return false;
            }

            for (const char ch : text)
            {
                if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_')
                {
                    return false;
                }
            }
            return true;
        }

        ReceiverKind convertReceiver(sigcheck::frontend::ReceiverForm form)
        {
            switch (form)
            {
            case sigcheck::frontend::ReceiverForm::None: return ReceiverKind::None;
            case sigcheck::frontend::ReceiverForm::Reference: return ReceiverKind::ByReference;
            case sigcheck::frontend::ReceiverForm::MutableReference: return ReceiverKind::ByMutableReference;
            case sigcheck::frontend::ReceiverForm::Value: return ReceiverKind::ByValue;
            }
            return ReceiverKind::None;
        }
    } // namespace

    std::optional<MarkerKind> markerKindForAttribute(std::string_view name) noexcept
    {
        if (name == "staticmethod") return MarkerKind::StaticMethod;
        if (name == "classmethod") return MarkerKind::ClassMethod;
        if (name == "classattr") return MarkerKind::ClassAttribute;
        if (name == "getter") return MarkerKind::Getter;
        if (name == "setter") return MarkerKind::Setter;
        if (name == "new") return MarkerKind::New;
        if (name == "call") return MarkerKind::Call;
        if (name == "text_signature") return MarkerKind::SignatureText;
        if (name == "name") return MarkerKind::NameOverride;
        if (name == "args") return MarkerKind::ArgumentList;
        if (name == "pass_module") return MarkerKind::PassModule;
        return std::nullopt;
    }

    DeclarationBuilder::DeclarationBuilder(const sigcheck::frontend::SourceFile& file)
        : m_file(file)
    {
    }

    std::vector<Declaration> DeclarationBuilder::build()
    {
        m_emitter.clear();

        std::vector<Declaration> declarations;
        for (const auto& block : m_file.blocks)
        {
            for (const auto& function : block.functions)
            {
                declarations.emplace_back(convertFunction(function, block));
            }
        }
        return declarations;
    }

    const std::vector<Diagnostic>& DeclarationBuilder::diagnostics() const noexcept
    {
        return m_emitter.diagnostics();
    }

    Declaration DeclarationBuilder::convertFunction(
        const sigcheck::frontend::FunctionDeclaration& function,
        const sigcheck::frontend::ItemBlock& block)
    {
        Declaration declaration{};
        declaration.name = function.name;
        declaration.nameSpan = function.nameSpan;
        declaration.scope = block.kind == sigcheck::frontend::BlockKind::Impl ? DeclarationScope::TypeBody
                                                                              : DeclarationScope::ModuleScope;
        declaration.ownerName = block.name;
        declaration.receiver.kind = convertReceiver(function.receiver.form);
        declaration.receiver.span = function.receiver.span;
        declaration.returnType = function.returnType;
        declaration.documentation = function.docLines;
        declaration.span = function.span;

        for (const auto& parameter : function.parameters)
        {
            Parameter converted{};
            converted.name = parameter.name;
            converted.typeText = parameter.typeName;
            converted.hasDefault = parameter.defaultValue.has_value();
            converted.isOpaqueExistential = parameter.typeIsImplTrait;
            converted.span = parameter.span;
            converted.nameSpan = parameter.nameSpan;
            converted.typeSpan = parameter.typeSpan;
            declaration.parameters.emplace_back(std::move(converted));
        }

        for (const auto& generic : function.genericParameters)
        {
            // Lifetimes carry no runtime representation.
            if (generic.form == sigcheck::frontend::GenericParameterForm::Lifetime)
            {
                continue;
            }

            GenericParameter converted{};
            converted.name = generic.name;
            converted.kind = generic.form == sigcheck::frontend::GenericParameterForm::Constant
                ? GenericParameterKind::Constant
                : GenericParameterKind::Type;
            converted.span = generic.span;
            declaration.genericParameters.emplace_back(std::move(converted));
        }

        const std::size_t before = m_emitter.count();
        for (const auto& attribute : function.attributes)
        {
            auto marker = decodeAttribute(attribute);
            if (marker.has_value())
            {
                declaration.markers.emplace_back(std::move(*marker));
            }
        }
        declaration.hasDecodingErrors = m_emitter.count() != before;

        return declaration;
    }

    std::optional<Marker> DeclarationBuilder::decodeAttribute(const sigcheck::frontend::Attribute& attribute)
    {
        const auto kind = markerKindForAttribute(attribute.name);
        if (!kind.has_value())
        {
            return std::nullopt;
        }

        Marker marker{};
        marker.kind = *kind;
        marker.span = attribute.span;

        bool decoded = false;
        switch (*kind)
        {
        case MarkerKind::StaticMethod:
        case MarkerKind::ClassMethod:
        case MarkerKind::ClassAttribute:
        case MarkerKind::New:
        case MarkerKind::Call:
        case MarkerKind::PassModule:
            decoded = decodeFlag(attribute, *kind);
            break;
        case MarkerKind::Getter:
        case MarkerKind::Setter:
            decoded = decodePropertyName(attribute, marker);
            break;
        case MarkerKind::SignatureText:
        case MarkerKind::NameOverride:
            decoded = decodeStringValue(attribute, marker);
            break;
        case MarkerKind::ArgumentList:
            decoded = decodeArgumentList(attribute, marker);
            break;
        }

        if (!decoded)
        {
            return std::nullopt;
        }
        return marker;
    }

    bool DeclarationBuilder::decodeFlag(const sigcheck::frontend::Attribute& attribute, MarkerKind kind)
    {
        if (attribute.assignedValue.has_value() || !attribute.arguments.empty())
        {
            emitError("SIGCHECK-E1200", std::string{markerSpelling(kind)} + " does not take arguments", attribute.span);
            return false;
        }
        return true;
    }

    bool DeclarationBuilder::decodePropertyName(const sigcheck::frontend::Attribute& attribute, Marker& marker)
    {
        if (attribute.assignedValue.has_value() || attribute.arguments.size() > 1)
        {
            emitError(
                "SIGCHECK-E1201",
                std::string{markerSpelling(marker.kind)} + " accepts at most one property name",
                attribute.span);
            return false;
        }

        if (attribute.arguments.empty())
        {
            return true;
        }

        const auto& argument = attribute.arguments.front();
        const bool usable = argument.name.empty()
            && (argument.valueKind == TokenKind::Identifier || argument.valueKind == TokenKind::StringLiteral)
            && isIdentifier(argument.value);
        if (!usable)
        {
            emitError(
                "SIGCHECK-E1201",
                std::string{markerSpelling(marker.kind)} + " property name must be an identifier",
                argument.span);
            return false;
        }

        marker.value = argument.value;
        marker.valueSpan = argument.valueSpan;
        return true;
    }

    bool DeclarationBuilder::decodeStringValue(const sigcheck::frontend::Attribute& attribute, Marker& marker)
    {
        if (!attribute.assignedValue.has_value() || attribute.assignedValueKind != TokenKind::StringLiteral)
        {
            emitError(
                "SIGCHECK-E1202",
                std::string{markerSpelling(marker.kind)} + " requires a string value, for example "
                    + attribute.name + " = \"...\"",
                attribute.span);
            return false;
        }

        if (marker.kind == MarkerKind::NameOverride && !isIdentifier(*attribute.assignedValue))
        {
            emitError("SIGCHECK-E1203", "name-override must be a valid identifier", attribute.assignedValueSpan);
            return false;
        }

        marker.value = *attribute.assignedValue;
        marker.valueSpan = attribute.assignedValueSpan;
        return true;
    }

    bool DeclarationBuilder::decodeArgumentList(const sigcheck::frontend::Attribute& attribute, Marker& marker)
    {
        if (!attribute.hasArgumentList || attribute.assignedValue.has_value())
        {
            emitError("SIGCHECK-E1204", "#[args] requires a parenthesised argument list", attribute.span);
            return false;
        }

        bool valid = true;
        for (const auto& argument : attribute.arguments)
        {
            ArgumentEntry entry{};
            entry.span = argument.span;

            if (argument.name.empty())
            {
                if (argument.valueKind == TokenKind::StringLiteral && argument.value == "*")
                {
                    entry.form = ArgumentEntryForm::KeywordOnlySeparator;
                }
                else if (argument.valueKind == TokenKind::Identifier)
                {
                    entry.form = ArgumentEntryForm::Positional;
                    entry.name = argument.value;
                }
                else
                {
                    emitError(
                        "SIGCHECK-E1205",
                        "only \"*\" is supported as a literal argument-list entry",
                        argument.span);
                    valid = false;
                    continue;
                }
            }
            else if (argument.valueSpan == SourceSpan{})
            {
                // The parser already reported the missing value.
                valid = false;
                continue;
            }
            else
            {
                entry.name = argument.name;
                if (argument.valueKind == TokenKind::StringLiteral && argument.value == "*")
                {
                    entry.form = ArgumentEntryForm::VarArgs;
                }
                else if (argument.valueKind == TokenKind::StringLiteral && argument.value == "**")
                {
                    entry.form = ArgumentEntryForm::KeywordArgs;
                }
                else
                {
                    entry.form = ArgumentEntryForm::Positional;
                    entry.defaultValue = argument.value;
                }
            }

            marker.entries.emplace_back(std::move(entry));
        }

        return valid;
    }

    void DeclarationBuilder::emitError(std::string code, std::string message, SourceSpan span)
    {
        m_emitter.emit(std::move(code), DiagnosticKind::Decoding, std::move(message), span);
    }
} // namespace sigcheck::methods
