#pragma once

#include "declaration.hpp"

#include <optional>
#include <string_view>

namespace sigcheck::methods
{
    enum class MethodRole
    {
        Instance,
        Static,
        ClassMethod,
        ClassAttribute,
        Getter,
        Setter,
        New,
        Call,
        FreeFunction
    };

    enum class ReceiverRule
    {
        Required,
        Forbidden
    };

    enum class ArityRule
    {
        Any,
        None,
        ExactlyOne
    };

    struct RoleShapeRules
    {
        ReceiverRule receiver{ReceiverRule::Forbidden};
        ArityRule arity{ArityRule::Any};
        // Roles with a single author-controlled call signature.
        bool acceptsSignatureText{false};
        bool acceptsArgumentList{false};
    };

    [[nodiscard]] RoleShapeRules rulesFor(MethodRole role) noexcept;
    [[nodiscard]] std::string_view toString(MethodRole role) noexcept;
    [[nodiscard]] std::string_view displayName(MethodRole role) noexcept;
    [[nodiscard]] std::optional<MethodRole> roleForMarker(MarkerKind kind) noexcept;
    [[nodiscard]] bool isPropertyRole(MethodRole role) noexcept;
} // namespace sigcheck::methods
