#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"

#include <optional>
#include <vector>

namespace sigcheck::methods
{
    // Markers chosen for one declaration. Pointers refer into the
    // declaration's marker list and share its lifetime.
    struct ResolvedMetadata
    {
        const Marker* roleMarker{nullptr};
        const Marker* signatureText{nullptr};
        const Marker* nameOverride{nullptr};
        const Marker* argumentList{nullptr};
        const Marker* passModule{nullptr};
        std::vector<const Marker*> contributors;
    };

    // Collapses the attached markers into at most one role-selecting marker
    // plus auxiliary options. Returns nullopt when two role-selecting markers
    // are present; the conflict is reported once, at the second marker.
    [[nodiscard]] std::optional<ResolvedMetadata> resolveMetadata(
        const Declaration& declaration,
        DiagnosticEmitter& emitter);
} // namespace sigcheck::methods
