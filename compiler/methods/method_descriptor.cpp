#include "method_descriptor.hpp"

#include "shape_validator.hpp"

#include <string_view>
#include <utility>

namespace sigcheck::methods
{
    namespace
    {
        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
        }

        bool isOptionType(std::string_view typeText)
        {
            return startsWith(typeText, "Option<") || startsWith(typeText, "std::option::Option<")
                || startsWith(typeText, "core::option::Option<") || startsWith(typeText, "::std::option::Option<")
                || startsWith(typeText, "::core::option::Option<");
        }

        std::string stripPrefix(const std::string& name, const std::string& prefix)
        {
            if (!prefix.empty() && name.size() > prefix.size() && startsWith(name, prefix))
            {
                return name.substr(prefix.size());
            }
            return name;
        }

        const ArgumentEntry* findEntry(const Marker* argumentList, const std::string& name)
        {
            if (argumentList == nullptr)
            {
                return nullptr;
            }

            for (const auto& entry : argumentList->entries)
            {
                if (entry.form != ArgumentEntryForm::KeywordOnlySeparator && entry.name == name)
                {
                    return &entry;
                }
            }
            return nullptr;
        }

        bool entryIsKeywordOnly(const Marker* argumentList, const ArgumentEntry* target)
        {
            if (argumentList == nullptr || target == nullptr || target->form != ArgumentEntryForm::Positional)
            {
                return false;
            }

            bool afterStar = false;
            for (const auto& entry : argumentList->entries)
            {
                if (&entry == target)
                {
                    return afterStar;
                }
                if (entry.form == ArgumentEntryForm::KeywordOnlySeparator || entry.form == ArgumentEntryForm::VarArgs)
                {
                    afterStar = true;
                }
            }
            return false;
        }

        std::string joinDocumentation(const std::vector<std::string>& lines)
        {
            std::string result;
            for (std::size_t index = 0; index < lines.size(); ++index)
            {
                if (index > 0)
                {
                    result.push_back('\n');
                }
                result.append(lines[index]);
            }
            return result;
        }
    } // namespace

    std::string exposedNameFor(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options)
    {
        if (metadata.nameOverride != nullptr && metadata.nameOverride->value.has_value())
        {
            return *metadata.nameOverride->value;
        }

        if (role == MethodRole::Getter || role == MethodRole::Setter)
        {
            if (metadata.roleMarker != nullptr && metadata.roleMarker->value.has_value())
            {
                return *metadata.roleMarker->value;
            }
            return stripPrefix(declaration.name, role == MethodRole::Getter ? options.getterPrefix : options.setterPrefix);
        }

        return declaration.name;
    }

    MethodDescriptor buildDescriptor(
        const Declaration& declaration,
        MethodRole role,
        const ResolvedMetadata& metadata,
        const CheckerOptions& options)
    {
        MethodDescriptor descriptor{};
        descriptor.sourceName = declaration.name;
        descriptor.exposedName = exposedNameFor(declaration, role, metadata, options);
        descriptor.role = role;
        descriptor.receiver = declaration.receiver.kind;
        descriptor.scope = declaration.scope;
        descriptor.ownerName = declaration.ownerName;
        descriptor.passModule = metadata.passModule != nullptr;
        descriptor.returnType = declaration.returnType;
        descriptor.span = declaration.span;

        const std::size_t skipped = implicitParameterCount(declaration, role, metadata);
        for (std::size_t index = skipped; index < declaration.parameters.size(); ++index)
        {
            const Parameter& parameter = declaration.parameters[index];
            const ArgumentEntry* entry = findEntry(metadata.argumentList, parameter.name);

            ParameterDescription description{};
            description.name = parameter.name;
            description.typeText = parameter.typeText;
            description.isVarArgs = entry != nullptr && entry->form == ArgumentEntryForm::VarArgs;
            description.isKeywordArgs = entry != nullptr && entry->form == ArgumentEntryForm::KeywordArgs;
            description.keywordOnly = entryIsKeywordOnly(metadata.argumentList, entry);
            description.isOptional = parameter.hasDefault || description.isVarArgs || description.isKeywordArgs
                || (entry != nullptr && entry->defaultValue.has_value()) || isOptionType(parameter.typeText);
            descriptor.parameters.emplace_back(std::move(description));
        }

        const std::string doc = joinDocumentation(declaration.documentation);
        if (metadata.signatureText != nullptr && metadata.signatureText->value.has_value())
        {
            descriptor.signatureText = *metadata.signatureText->value;
            descriptor.documentation = descriptor.exposedName + *descriptor.signatureText + "\n--\n\n" + doc;
        }
        else
        {
            descriptor.documentation = doc;
        }

        return descriptor;
    }
} // namespace sigcheck::methods
