#include "metadata_resolver.hpp"

#include <string>

namespace sigcheck::methods
{
    namespace
    {
        const Marker** auxiliarySlot(ResolvedMetadata& metadata, MarkerKind kind)
        {
            switch (kind)
            {
            case MarkerKind::SignatureText: return &metadata.signatureText;
            case MarkerKind::NameOverride: return &metadata.nameOverride;
            case MarkerKind::ArgumentList: return &metadata.argumentList;
            case MarkerKind::PassModule: return &metadata.passModule;
            default: return nullptr;
            }
        }
    } // namespace

    std::optional<ResolvedMetadata> resolveMetadata(const Declaration& declaration, DiagnosticEmitter& emitter)
    {
        ResolvedMetadata metadata{};
        bool roleConflict = false;

        for (const auto& marker : declaration.markers)
        {
            if (isRoleSelecting(marker.kind))
            {
                if (metadata.roleMarker == nullptr)
                {
                    metadata.roleMarker = &marker;
                    metadata.contributors.push_back(&marker);
                }
                else if (!roleConflict)
                {
                    roleConflict = true;
                    emitter.emit(
                        "SIGCHECK-E2000",
                        DiagnosticKind::Conflict,
                        "cannot specify a second method type",
                        marker.span,
                        {metadata.roleMarker->span});
                }
                continue;
            }

            const Marker** slot = auxiliarySlot(metadata, marker.kind);
            if (slot == nullptr)
            {
                continue;
            }

            if (*slot != nullptr)
            {
                emitter.emit(
                    "SIGCHECK-E2001",
                    DiagnosticKind::DuplicateMarker,
                    std::string{markerSpelling(marker.kind)} + " may only be specified once",
                    marker.span,
                    {(*slot)->span});
                continue;
            }

            *slot = &marker;
            metadata.contributors.push_back(&marker);
        }

        if (roleConflict)
        {
            return std::nullopt;
        }
        return metadata;
    }
} // namespace sigcheck::methods
