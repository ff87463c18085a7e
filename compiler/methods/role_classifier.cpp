#include "role_classifier.hpp"

#include <string>

namespace sigcheck::methods
{
    std::optional<MethodRole> classifyRole(
        const Declaration& declaration,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter)
    {
        if (metadata.roleMarker != nullptr)
        {
            if (declaration.scope == DeclarationScope::ModuleScope)
            {
                emitter.emit(
                    "SIGCHECK-E2101",
                    DiagnosticKind::MissingDesignation,
                    std::string{markerSpelling(metadata.roleMarker->kind)}
                        + " is a method-type marker and is only allowed inside a type body",
                    metadata.roleMarker->span);
                return std::nullopt;
            }
            return roleForMarker(metadata.roleMarker->kind);
        }

        if (declaration.scope == DeclarationScope::ModuleScope)
        {
            return MethodRole::FreeFunction;
        }

        if (!declaration.receiver.present() && declaration.parameters.empty()
            && declaration.name == options.constructorName)
        {
            return MethodRole::New;
        }

        if (declaration.receiver.present())
        {
            return MethodRole::Instance;
        }

        emitter.emit(
            "SIGCHECK-E2100",
            DiagnosticKind::MissingDesignation,
            "static method needs the static-method designation",
            declaration.nameSpan);
        return std::nullopt;
    }
} // namespace sigcheck::methods
