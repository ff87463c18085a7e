#include "method_role.hpp"

namespace sigcheck::methods
{
    RoleShapeRules rulesFor(MethodRole role) noexcept
    {
        RoleShapeRules rules{};
        switch (role)
        {
        case MethodRole::Instance:
            rules.receiver = ReceiverRule::Required;
            rules.arity = ArityRule::Any;
            rules.acceptsSignatureText = true;
            rules.acceptsArgumentList = true;
            break;
        case MethodRole::Static:
        case MethodRole::ClassMethod:
        case MethodRole::FreeFunction:
            rules.receiver = ReceiverRule::Forbidden;
            rules.arity = ArityRule::Any;
            rules.acceptsSignatureText = true;
            rules.acceptsArgumentList = true;
            break;
        case MethodRole::ClassAttribute:
            rules.receiver = ReceiverRule::Forbidden;
            rules.arity = ArityRule::None;
            break;
        case MethodRole::Getter:
            rules.receiver = ReceiverRule::Required;
            rules.arity = ArityRule::None;
            break;
        case MethodRole::Setter:
            rules.receiver = ReceiverRule::Required;
            rules.arity = ArityRule::ExactlyOne;
            break;
        case MethodRole::New:
            rules.receiver = ReceiverRule::Forbidden;
            rules.arity = ArityRule::Any;
            rules.acceptsArgumentList = true;
            break;
        case MethodRole::Call:
            rules.receiver = ReceiverRule::Required;
            rules.arity = ArityRule::Any;
            rules.acceptsSignatureText = true;
            rules.acceptsArgumentList = true;
            break;
        }
        return rules;
    }

    std::string_view toString(MethodRole role) noexcept
    {
        switch (role)
        {
        case MethodRole::Instance: return "instance";
        case MethodRole::Static: return "static";
        case MethodRole::ClassMethod: return "classMethod";
        case MethodRole::ClassAttribute: return "classAttribute";
        case MethodRole::Getter: return "getter";
        case MethodRole::Setter: return "setter";
        case MethodRole::New: return "new";
        case MethodRole::Call: return "call";
        case MethodRole::FreeFunction: return "freeFunction";
        }
        return "unknown";
    }

    std::string_view displayName(MethodRole role) noexcept
    {
        switch (role)
        {
        case MethodRole::Instance: return "instance method";
        case MethodRole::Static: return "static method";
        case MethodRole::ClassMethod: return "class method";
        case MethodRole::ClassAttribute: return "class attribute";
        case MethodRole::Getter: return "getter";
        case MethodRole::Setter: return "setter";
        case MethodRole::New: return "constructor";
        case MethodRole::Call: return "call";
        case MethodRole::FreeFunction: return "free function";
        }
        return "method";
    }

    std::optional<MethodRole> roleForMarker(MarkerKind kind) noexcept
    {
        switch (kind)
        {
        case MarkerKind::StaticMethod: return MethodRole::Static;
        case MarkerKind::ClassMethod: return MethodRole::ClassMethod;
        case MarkerKind::ClassAttribute: return MethodRole::ClassAttribute;
        case MarkerKind::Getter: return MethodRole::Getter;
        case MarkerKind::Setter: return MethodRole::Setter;
        case MarkerKind::New: return MethodRole::New;
        case MarkerKind::Call: return MethodRole::Call;
        case MarkerKind::SignatureText:
        case MarkerKind::NameOverride:
        case MarkerKind::ArgumentList:
        case MarkerKind::PassModule:
            return std::nullopt;
        }
        return std::nullopt;
    }

    bool isPropertyRole(MethodRole role) noexcept
    {
        return role == MethodRole::Getter || role == MethodRole::Setter || role == MethodRole::ClassAttribute;
    }
} // namespace sigcheck::methods
