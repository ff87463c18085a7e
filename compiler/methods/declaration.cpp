#include "declaration.hpp"

namespace sigcheck::methods
{
    bool isRoleSelecting(MarkerKind kind) noexcept
    {
        switch (kind)
        {
        case MarkerKind::StaticMethod:
        case MarkerKind::ClassMethod:
        case MarkerKind::ClassAttribute:
        case MarkerKind::Getter:
        case MarkerKind::Setter:
        case MarkerKind::New:
        case MarkerKind::Call:
            return true;
        case MarkerKind::SignatureText:
        case MarkerKind::NameOverride:
        case MarkerKind::ArgumentList:
        case MarkerKind::PassModule:
            return false;
        }
        return false;
    }

    const char* markerSpelling(MarkerKind kind) noexcept
    {
        switch (kind)
        {
        case MarkerKind::StaticMethod: return "#[staticmethod]";
        case MarkerKind::ClassMethod: return "#[classmethod]";
        case MarkerKind::ClassAttribute: return "#[classattr]";
        case MarkerKind::Getter: return "#[getter]";
        case MarkerKind::Setter: return "#[setter]";
        case MarkerKind::New: return "#[new]";
        case MarkerKind::Call: return "#[call]";
        case MarkerKind::SignatureText: return "#[text_signature]";
        case MarkerKind::NameOverride: return "#[name]";
        case MarkerKind::ArgumentList: return "#[args]";
        case MarkerKind::PassModule: return "#[pass_module]";
        }
        return "#[?]";
    }
} // namespace sigcheck::methods
