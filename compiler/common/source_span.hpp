#pragma once

#include <cstdint>

namespace sigcheck
{
    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    [[nodiscard]] inline bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return lhs.line == rhs.line && lhs.column == rhs.column;
    }

    [[nodiscard]] inline bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    [[nodiscard]] inline bool operator<(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return lhs.line < rhs.line || (lhs.line == rhs.line && lhs.column < rhs.column);
    }

    [[nodiscard]] inline bool operator==(const SourceSpan& lhs, const SourceSpan& rhs) noexcept
    {
        return lhs.begin == rhs.begin && lhs.end == rhs.end;
    }

    [[nodiscard]] inline bool operator!=(const SourceSpan& lhs, const SourceSpan& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    [[nodiscard]] inline SourceSpan mergeSpans(const SourceSpan& a, const SourceSpan& b) noexcept
    {
        SourceSpan span = a;
        if (b.begin < span.begin)
        {
            span.begin = b.begin;
        }
        if (span.end < b.end)
        {
            span.end = b.end;
        }
        return span;
    }
} // namespace sigcheck
