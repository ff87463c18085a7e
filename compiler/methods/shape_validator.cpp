#include "shape_validator.hpp"

#include <string>
#include <unordered_set>

namespace sigcheck::methods
{
    namespace
    {
        std::string_view trimLeft(std::string_view text) noexcept
        {
            while (!text.empty() && text.front() == ' ')
            {
                text.remove_prefix(1);
            }
            return text;
        }

        class ShapeChecker
        {
        public:
            ShapeChecker(
                const Declaration& declaration,
                MethodRole role,
                const ResolvedMetadata& metadata,
                const CheckerOptions& options,
                DiagnosticEmitter& emitter)
                : m_declaration(declaration)
                , m_role(role)
                , m_rules(rulesFor(role))
                , m_metadata(metadata)
                , m_options(options)
                , m_emitter(emitter)
            {
            }

            void run()
            {
                checkReceiver();
                checkParameters();
                checkGenerics();
                checkSignatureText();
                checkNameOverride();
                checkArgumentList();
                checkPassModule();
            }

        private:
            void checkReceiver()
            {
                const Receiver& receiver = m_declaration.receiver;
                if (m_rules.receiver == ReceiverRule::Forbidden && receiver.present())
                {
                    m_emitter.emit("SIGCHECK-E2200", DiagnosticKind::StructuralShape, "unexpected receiver", receiver.span);
                }
                else if (m_rules.receiver == ReceiverRule::Required && !receiver.present())
                {
                    m_emitter.emit(
                        "SIGCHECK-E2201",
                        DiagnosticKind::StructuralShape,
                        "expected receiver for " + std::string{displayName(m_role)},
                        m_declaration.nameSpan);
                }
            }

            void checkParameters()
            {
                const auto& parameters = m_declaration.parameters;

                if (m_role == MethodRole::ClassMethod)
                {
                    if (parameters.empty())
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2208",
                            DiagnosticKind::StructuralShape,
                            classMethodMessage(),
                            m_declaration.nameSpan);
                    }
                    else if (!isSharedReferenceTo(parameters.front().typeText, m_options.typeObjectName))
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2208",
                            DiagnosticKind::StructuralShape,
                            classMethodMessage(),
                            parameters.front().typeSpan);
                    }
                }

                if (m_role == MethodRole::FreeFunction && m_metadata.passModule != nullptr)
                {
                    const std::string message = "expected &" + m_options.moduleTypeName + " as first argument with pass_module";
                    if (parameters.empty())
                    {
                        m_emitter.emit("SIGCHECK-E2209", DiagnosticKind::StructuralShape, message, m_declaration.nameSpan);
                    }
                    else if (!isSharedReferenceTo(parameters.front().typeText, m_options.moduleTypeName))
                    {
                        m_emitter.emit("SIGCHECK-E2209", DiagnosticKind::StructuralShape, message, parameters.front().typeSpan);
                    }
                }

                switch (m_rules.arity)
                {
                case ArityRule::Any:
                    break;
                case ArityRule::None:
                    if (!parameters.empty())
                    {
                        if (m_role == MethodRole::ClassAttribute)
                        {
                            m_emitter.emit(
                                "SIGCHECK-E2204",
                                DiagnosticKind::StructuralShape,
                                "class attribute methods cannot take arguments",
                                parameters.front().span);
                        }
                        else
                        {
                            m_emitter.emit(
                                "SIGCHECK-E2205",
                                DiagnosticKind::StructuralShape,
                                std::string{displayName(m_role)} + " functions cannot take arguments",
                                parameters.front().span);
                        }
                    }
                    break;
                case ArityRule::ExactlyOne:
                    if (parameters.empty())
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2206",
                            DiagnosticKind::StructuralShape,
                            std::string{displayName(m_role)} + " function expected to have one argument",
                            m_declaration.nameSpan);
                    }
                    else if (parameters.size() > 1)
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2207",
                            DiagnosticKind::StructuralShape,
                            std::string{displayName(m_role)} + " function can have at most one argument",
                            parameters[1].span);
                    }
                    break;
                }

                for (const auto& parameter : parameters)
                {
                    if (parameter.isOpaqueExistential)
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2301",
                            DiagnosticKind::UnsupportedForm,
                            "opaque-existential parameter types not supported",
                            parameter.typeSpan);
                    }
                }
            }

            void checkGenerics()
            {
                if (!m_declaration.genericParameters.empty())
                {
                    m_emitter.emit(
                        "SIGCHECK-E2300",
                        DiagnosticKind::UnsupportedForm,
                        "generic type parameters not supported",
                        m_declaration.genericParameters.front().span);
                }
            }

            void checkSignatureText()
            {
                const Marker* marker = m_metadata.signatureText;
                if (marker == nullptr)
                {
                    return;
                }

                if (m_role == MethodRole::New)
                {
                    m_emitter.emit(
                        "SIGCHECK-E2400",
                        DiagnosticKind::OptionApplicability,
                        "signature-text not allowed on the constructor; put it on the enclosing type definition instead",
                        marker->span);
                    return;
                }

                if (!m_rules.acceptsSignatureText)
                {
                    std::string message = "signature-text not allowed on " + std::string{displayName(m_role)} + " methods";
                    if (isPropertyRole(m_role))
                    {
                        message += ": a property has no call signature";
                    }
                    m_emitter.emit("SIGCHECK-E2401", DiagnosticKind::OptionApplicability, message, marker->span);
                    return;
                }

                const std::string& text = marker->value.value_or(std::string{});
                if (text.size() < 2 || text.front() != '(' || text.back() != ')')
                {
                    m_emitter.emit(
                        "SIGCHECK-E2402",
                        DiagnosticKind::OptionApplicability,
                        "text signature must be a parenthesised parameter list",
                        marker->valueSpan);
                }
            }

            void checkNameOverride()
            {
                const Marker* marker = m_metadata.nameOverride;
                if (marker == nullptr)
                {
                    return;
                }

                if (m_role == MethodRole::New)
                {
                    m_emitter.emit(
                        "SIGCHECK-E2403",
                        DiagnosticKind::OptionApplicability,
                        "name-override is not allowed on the constructor",
                        marker->span);
                    return;
                }

                const Marker* roleMarker = m_metadata.roleMarker;
                if ((m_role == MethodRole::Getter || m_role == MethodRole::Setter) && roleMarker != nullptr
                    && roleMarker->value.has_value())
                {
                    m_emitter.emit(
                        "SIGCHECK-E2408",
                        DiagnosticKind::OptionApplicability,
                        "property name given both as marker argument and name-override",
                        marker->span,
                        {roleMarker->valueSpan});
                }
            }

            void checkArgumentList()
            {
                const Marker* marker = m_metadata.argumentList;
                if (marker == nullptr)
                {
                    return;
                }

                if (!m_rules.acceptsArgumentList)
                {
                    m_emitter.emit(
                        "SIGCHECK-E2404",
                        DiagnosticKind::OptionApplicability,
                        "argument list is not allowed on " + std::string{displayName(m_role)} + " methods",
                        marker->span);
                    return;
                }

                std::unordered_set<std::string> parameterNames;
                const std::size_t skipped = implicitParameterCount(m_declaration, m_role, m_metadata);
                for (std::size_t index = skipped; index < m_declaration.parameters.size(); ++index)
                {
                    parameterNames.insert(m_declaration.parameters[index].name);
                }

                bool hasVarArgs = false;
                bool hasKeywordArgs = false;
                std::unordered_set<std::string> seenNames;

                for (const auto& entry : marker->entries)
                {
                    switch (entry.form)
                    {
                    case ArgumentEntryForm::KeywordOnlySeparator:
                    case ArgumentEntryForm::VarArgs:
                        if (hasVarArgs || hasKeywordArgs)
                        {
                            reportEntry("* is not allowed after varargs(*) or kwargs(**)", entry);
                        }
                        hasVarArgs = true;
                        break;
                    case ArgumentEntryForm::KeywordArgs:
                        if (hasKeywordArgs)
                        {
                            reportEntry("arguments already define ** (kw args)", entry);
                        }
                        hasKeywordArgs = true;
                        break;
                    case ArgumentEntryForm::Positional:
                        if (hasKeywordArgs)
                        {
                            reportEntry("positional argument or varargs(*) not allowed after keyword arguments", entry);
                        }
                        break;
                    }

                    if (entry.form == ArgumentEntryForm::KeywordOnlySeparator)
                    {
                        continue;
                    }

                    if (parameterNames.find(entry.name) == parameterNames.end())
                    {
                        m_emitter.emit(
                            "SIGCHECK-E2406",
                            DiagnosticKind::OptionApplicability,
                            "argument list names unknown parameter '" + entry.name + "'",
                            entry.span);
                    }
                    else if (!seenNames.insert(entry.name).second)
                    {
                        reportEntry("parameter '" + entry.name + "' appears more than once in the argument list", entry);
                    }
                }
            }

            void checkPassModule()
            {
                const Marker* marker = m_metadata.passModule;
                if (marker != nullptr && m_role != MethodRole::FreeFunction)
                {
                    m_emitter.emit(
                        "SIGCHECK-E2407",
                        DiagnosticKind::OptionApplicability,
                        "pass_module is only allowed on free functions",
                        marker->span);
                }
            }

            void reportEntry(const std::string& message, const ArgumentEntry& entry)
            {
                m_emitter.emit("SIGCHECK-E2405", DiagnosticKind::OptionApplicability, message, entry.span);
            }

            std::string classMethodMessage() const
            {
                return "class method expects a type-object reference (&" + m_options.typeObjectName
                    + ") as its first argument";
            }

        private:
            const Declaration& m_declaration;
            MethodRole m_role;
            RoleShapeRules m_rules;
            const ResolvedMetadata& m_metadata;
            const CheckerOptions& m_options;
            DiagnosticEmitter& m_emitter;
        };
    } // namespace

    bool validateShape(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter)
    {
        const std::size_t before = emitter.count();
        ShapeChecker checker{declaration, role, metadata, options, emitter};
        checker.run();
        return emitter.count() == before;
    }

    std::size_t implicitParameterCount(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata) noexcept
    {
        if (declaration.parameters.empty())
        {
            return 0;
        }

        if (role == MethodRole::ClassMethod)
        {
            return 1;
        }

        if (role == MethodRole::FreeFunction && metadata.passModule != nullptr)
        {
            return 1;
        }

        return 0;
    }

    bool isSharedReferenceTo(std::string_view typeText, std::string_view typeName) noexcept
    {
        if (typeText.empty() || typeText.front() != '&')
        {
            return false;
        }

        std::string_view rest = trimLeft(typeText.substr(1));
        if (!rest.empty() && rest.front() == '\'')
        {
            const auto space = rest.find(' ');
            if (space == std::string_view::npos)
            {
                return false;
            }
            rest = trimLeft(rest.substr(space + 1));
        }

        const auto separator = rest.rfind("::");
        if (separator != std::string_view::npos)
        {
            rest = rest.substr(separator + 2);
        }

        return rest == typeName;
    }
} // namespace sigcheck::methods
