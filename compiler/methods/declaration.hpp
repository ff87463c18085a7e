#pragma once

#include "../common/source_span.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigcheck::methods
{
    using sigcheck::SourceSpan;

    enum class ReceiverKind
    {
        None,
        ByReference,
        ByMutableReference,
        ByValue
    };

    struct Receiver
    {
        ReceiverKind kind{ReceiverKind::None};
        SourceSpan span;

        [[nodiscard]] bool present() const noexcept
        {
            return kind != ReceiverKind::None;
        }
    };

    struct Parameter
    {
        std::string name;
        std::string typeText;
        bool hasDefault{false};
        // Type is written as "any type satisfying X" (`impl Trait`).
        bool isOpaqueExistential{false};
        SourceSpan span;
        SourceSpan nameSpan;
        SourceSpan typeSpan;
    };

    enum class GenericParameterKind
    {
        Type,
        Constant
    };

    struct GenericParameter
    {
        std::string name;
        GenericParameterKind kind{GenericParameterKind::Type};
        SourceSpan span;
    };

    enum class MarkerKind
    {
        // Role-selecting markers.
        StaticMethod,
        ClassMethod,
        ClassAttribute,
        Getter,
        Setter,
        New,
        Call,

        // Auxiliary options.
        SignatureText,
        NameOverride,
        ArgumentList,
        PassModule
    };

    [[nodiscard]] bool isRoleSelecting(MarkerKind kind) noexcept;
    [[nodiscard]] const char* markerSpelling(MarkerKind kind) noexcept;

    enum class ArgumentEntryForm
    {
        // Bare "*": every following entry is keyword-only.
        KeywordOnlySeparator,
        VarArgs,
        KeywordArgs,
        Positional
    };

    struct ArgumentEntry
    {
        ArgumentEntryForm form{ArgumentEntryForm::Positional};
        std::string name;
        std::optional<std::string> defaultValue;
        SourceSpan span;
    };

    struct Marker
    {
        MarkerKind kind{MarkerKind::StaticMethod};
        SourceSpan span;
        std::optional<std::string> value;
        SourceSpan valueSpan;
        std::vector<ArgumentEntry> entries;
    };

    enum class DeclarationScope
    {
        TypeBody,
        ModuleScope
    };

    struct Declaration
    {
        std::string name;
        SourceSpan nameSpan;
        DeclarationScope scope{DeclarationScope::TypeBody};
        std::string ownerName;
        Receiver receiver;
        std::vector<Parameter> parameters;
        std::vector<GenericParameter> genericParameters;
        std::optional<std::string> returnType;
        std::vector<Marker> markers;
        std::vector<std::string> documentation;
        SourceSpan span;
        // Set when one of the attributes failed to decode. The failing
        // attribute is already reported and the Declaration is not checked.
        bool hasDecodingErrors{false};
    };
} // namespace sigcheck::methods
