#pragma once

#include "../common/source_span.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sigcheck::methods
{
    enum class DiagnosticKind
    {
        Decoding,
        Conflict,
        DuplicateMarker,
        MissingDesignation,
        StructuralShape,
        UnsupportedForm,
        OptionApplicability
    };

    [[nodiscard]] std::string_view toString(DiagnosticKind kind) noexcept;

    struct Diagnostic
    {
        std::string code;
        DiagnosticKind kind{DiagnosticKind::StructuralShape};
        std::string message;
        SourceSpan span;
        std::vector<SourceSpan> secondarySpans;
    };

    // Collects diagnostics in the order they are reported. Never merges or
    // drops entries.
    class DiagnosticEmitter
    {
    public:
        void emit(std::string code, DiagnosticKind kind, std::string message, SourceSpan span);
        void emit(
            std::string code,
            DiagnosticKind kind,
            std::string message,
            SourceSpan span,
            std::vector<SourceSpan> secondarySpans);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] std::size_t count() const noexcept;
        [[nodiscard]] bool empty() const noexcept;

        void clear() noexcept;
        [[nodiscard]] std::vector<Diagnostic> take();

    private:
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace sigcheck::methods
