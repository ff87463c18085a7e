#pragma once

#include "checker_options.hpp"
#include "declaration.hpp"
#include "metadata_resolver.hpp"
#include "method_role.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigcheck::methods
{
    struct ParameterDescription
    {
        std::string name;
        std::string typeText;
        bool isOptional{false};
        bool keywordOnly{false};
        bool isVarArgs{false};
        bool isKeywordArgs{false};
    };

    struct MethodDescriptor
    {
        std::string sourceName;
        std::string exposedName;
        MethodRole role{MethodRole::Instance};
        ReceiverKind receiver{ReceiverKind::None};
        DeclarationScope scope{DeclarationScope::TypeBody};
        std::string ownerName;
        std::vector<ParameterDescription> parameters;
        bool passModule{false};
        std::optional<std::string> signatureText;
        std::string documentation;
        std::optional<std::string> returnType;
        SourceSpan span;
    };

    struct MethodTable
    {
        std::vector<MethodDescriptor> methods;
    };

    // Only meaningful for a declaration that passed every check.
    [[nodiscard]] MethodDescriptor buildDescriptor(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options);

    [[nodiscard]] std::string exposedNameFor(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options);
} // namespace sigcheck::methods
