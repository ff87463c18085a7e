#pragma once

#include "../frontend/ast.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sigcheck::methods
{
    // Turns parsed declaration blocks into Declarations, decoding the
    // recognised attributes into structured markers. Attributes that are not
    // markers are left alone.
    class DeclarationBuilder
    {
    public:
        explicit DeclarationBuilder(const sigcheck::frontend::SourceFile& file);

        [[nodiscard]] std::vector<Declaration> build();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        Declaration convertFunction(
            const sigcheck::frontend::FunctionDeclaration& function,
            const sigcheck::frontend::ItemBlock& block);
        std::optional<Marker> decodeAttribute(const sigcheck::frontend::Attribute& attribute);
        bool decodeFlag(const sigcheck::frontend::Attribute& attribute, MarkerKind kind);
        bool decodePropertyName(const sigcheck::frontend::Attribute& attribute, Marker& marker);
        bool decodeStringValue(const sigcheck::frontend::Attribute& attribute, Marker& marker);
        bool decodeArgumentList(const sigcheck::frontend::Attribute& attribute, Marker& marker);
        void emitError(std::string code, std::string message, SourceSpan span);

    private:
        const sigcheck::frontend::SourceFile& m_file;
        DiagnosticEmitter m_emitter;
    };

    [[nodiscard]] std::optional<MarkerKind> markerKindForAttribute(std::string_view name) noexcept;
} // namespace sigcheck::methods
