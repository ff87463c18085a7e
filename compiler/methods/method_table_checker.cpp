#include "method_table_checker.hpp"

#include "metadata_resolver.hpp"
#include "role_classifier.hpp"
#include "shape_validator.hpp"

#include <utility>

namespace sigcheck::methods
{
    std::optional<MethodDescriptor> checkDeclaration(
        const Declaration& declaration,
        const CheckerOptions& options,
        DiagnosticEmitter& emitter)
    {
        if (declaration.hasDecodingErrors)
        {
            return std::nullopt;
        }

        const std::size_t before = emitter.count();

        const auto metadata = resolveMetadata(declaration, emitter);
        if (!metadata.has_value())
        {
            return std::nullopt;
        }

        const auto role = classifyRole(declaration, *metadata, options, emitter);
        if (!role.has_value())
        {
            return std::nullopt;
        }

        const bool shapeIsValid = validateShape(declaration, *role, *metadata, options, emitter);

        // Duplicate auxiliary markers are reported by the resolver without
        // stopping classification; they still block the descriptor.
        if (!shapeIsValid || emitter.count() != before)
        {
            return std::nullopt;
        }

        return buildDescriptor(declaration, *role, *metadata, options);
    }

    MethodTableChecker::MethodTableChecker(const std::vector<Declaration>& declarations, CheckerOptions options)
        : m_declarations(declarations)
        , m_options(std::move(options))
    {
    }

    MethodTable MethodTableChecker::check()
    {
        m_emitter.clear();

        MethodTable table{};
        for (const auto& declaration : m_declarations)
        {
            auto descriptor = checkDeclaration(declaration, m_options, m_emitter);
            if (descriptor.has_value())
            {
                table.methods.emplace_back(std::move(*descriptor));
            }
        }
        return table;
    }

    const std::vector<Diagnostic>& MethodTableChecker::diagnostics() const noexcept
    {
        return m_emitter.diagnostics();
    }
} // namespace sigcheck::methods
