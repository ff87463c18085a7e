#pragma once

#include "checker_options.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"
#include "metadata_resolver.hpp"
#include "method_role.hpp"

#include <optional>

namespace sigcheck::methods
{
    // Chooses exactly one role for the declaration. An explicit marker is
    // authoritative; otherwise the role is inferred from scope, receiver and
    // name. A receiver-less method in a type body is never inferred to be
    // static.
    [[nodiscard]] std::optional<MethodRole> classifyRole(
        const Declaration& declaration,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter);
} // namespace sigcheck::methods
