#include "diagnostic.hpp"

#include <utility>

namespace sigcheck::methods
{
    std::string_view toString(DiagnosticKind kind) noexcept
    {
        switch (kind)
        {
        case DiagnosticKind::Decoding: return "decoding";
        case DiagnosticKind::Conflict: return "conflict";
        case DiagnosticKind::DuplicateMarker: return "duplicateMarker";
        case DiagnosticKind::MissingDesignation: return "missingDesignation";
        case DiagnosticKind::StructuralShape: return "structuralShape";
        case DiagnosticKind::UnsupportedForm: return "unsupportedForm";
        case DiagnosticKind::OptionApplicability: return "optionApplicability";
        }
        return "unknown";
    }

    void DiagnosticEmitter::emit(std::string code, DiagnosticKind kind, std::string message, SourceSpan span)
    {
        emit(std::move(code), kind, std::move(message), span, {});
    }

    void DiagnosticEmitter::emit(
        std::string code,
        DiagnosticKind kind,
        std::string message,
        SourceSpan span,
        std::vector<SourceSpan> secondarySpans)
    {
        Diagnostic diag;
        diag.code = std::move(code);
        diag.kind = kind;
        diag.message = std::move(message);
        diag.span = span;
        diag.secondarySpans = std::move(secondarySpans);
        m_diagnostics.emplace_back(std::move(diag));
    }

    const std::vector<Diagnostic>& DiagnosticEmitter::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::size_t DiagnosticEmitter::count() const noexcept
    {
        return m_diagnostics.size();
    }

    bool DiagnosticEmitter::empty() const noexcept
    {
        return m_diagnostics.empty();
    }

    void DiagnosticEmitter::clear() noexcept
    {
        m_diagnostics.clear();
    }

    std::vector<Diagnostic> DiagnosticEmitter::take()
    {
        std::vector<Diagnostic> taken = std::move(m_diagnostics);
        m_diagnostics.clear();
        return taken;
    }
} // namespace sigcheck::methods
