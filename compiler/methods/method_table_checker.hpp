#pragma once

#include "checker_options.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"
#include "method_descriptor.hpp"

#include <optional>
#include <vector>

namespace sigcheck::methods
{
    // Resolves, classifies and validates one declaration. Diagnostics are
    // appended to the emitter; a descriptor is returned only when the
    // declaration produced none.
    [[nodiscard]] std::optional<MethodDescriptor> checkDeclaration(
        const Declaration& declaration,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter);

    class MethodTableChecker
    {
    public:
        explicit MethodTableChecker(const std::vector<Declaration>& declarations, CheckerOptions options = {});

        // Checks every declaration in batch order. A failing declaration
        // never stops the batch.
        [[nodiscard]] MethodTable check();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const std::vector<Declaration>& m_declarations;
        CheckerOptions m_options;
        DiagnosticEmitter m_emitter;
    };
} // namespace sigcheck::methods
