#pragma once

#include "checker_options.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"
#include "metadata_resolver.hpp"
#include "method_role.hpp"

#include <cstddef>
#include <string_view>

namespace sigcheck::methods
{
    // Checks the declaration against the rules of its role and reports every
    // independent violation. Checks run in field order: receiver, parameters,
    // generic parameters, auxiliary options. Returns true when nothing was
    // reported.
    bool validateShape(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter);

    // Number of leading parameters supplied by the runtime rather than the
    // caller (the type object of a class method, the module of a
    // pass_module function).
    [[nodiscard]] std::size_t implicitParameterCount(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata) noexcept;

    // True for `&Name`, `&'a Name` and `&path::Name`.
    [[nodiscard]] bool isSharedReferenceTo(std::string_view typeText, std::string_view typeName) noexcept;
} // namespace sigcheck::methods
