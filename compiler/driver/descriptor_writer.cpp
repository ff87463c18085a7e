#include "descriptor_writer.hpp"

#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace sigcheck
{
    namespace
    {
        std::string_view toReceiverString(methods::ReceiverKind kind)
        {
            switch (kind)
            {
            case methods::ReceiverKind::None:
                return "none";
            case methods::ReceiverKind::ByReference:
                return "reference";
            case methods::ReceiverKind::ByMutableReference:
                return "mutableReference";
            case methods::ReceiverKind::ByValue:
                return "value";
            }

            return "unknown";
        }

        std::string_view toScopeString(methods::DeclarationScope scope)
        {
            return scope == methods::DeclarationScope::TypeBody ? "type" : "module";
        }

        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('a' + (value - 10)));
        }

        std::string escapeJson(std::string_view value)
        {
            std::string result;
            result.reserve(value.size() + 8);

            for (unsigned char ch : value)
            {
                switch (ch)
                {
                case '\\':
                    result += "\\\\";
                    break;
                case '"':
                    result += "\\\"";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (ch < 0x20)
                    {
                        result += "\\u00";
                        result.push_back(hexDigit((ch >> 4) & 0xF));
                        result.push_back(hexDigit(ch & 0xF));
                    }
                    else
                    {
                        result.push_back(static_cast<char>(ch));
                    }
                    break;
                }
            }

            return result;
        }

        const char* toBool(bool value)
        {
            return value ? "true" : "false";
        }

        void writeParameter(std::ostringstream& stream, const methods::ParameterDescription& parameter)
        {
            stream << "        {"
                   << "\"name\": \"" << escapeJson(parameter.name) << "\", "
                   << "\"type\": \"" << escapeJson(parameter.typeText) << "\", "
                   << "\"optional\": " << toBool(parameter.isOptional) << ", "
                   << "\"keywordOnly\": " << toBool(parameter.keywordOnly) << ", "
                   << "\"varArgs\": " << toBool(parameter.isVarArgs) << ", "
                   << "\"keywordArgs\": " << toBool(parameter.isKeywordArgs)
                   << "}";
        }

        void writeMethod(std::ostringstream& stream, const methods::MethodDescriptor& method)
        {
            stream << "    {\n";
            stream << "      \"name\": \"" << escapeJson(method.exposedName) << "\",\n";
            stream << "      \"sourceName\": \"" << escapeJson(method.sourceName) << "\",\n";
            stream << "      \"role\": \"" << escapeJson(methods::toString(method.role)) << "\",\n";
            stream << "      \"receiver\": \"" << toReceiverString(method.receiver) << "\",\n";
            stream << "      \"scope\": \"" << toScopeString(method.scope) << "\",\n";
            stream << "      \"owner\": \"" << escapeJson(method.ownerName) << "\",\n";
            stream << "      \"passModule\": " << toBool(method.passModule) << ",\n";

            if (method.signatureText.has_value())
            {
                stream << "      \"signature\": \"" << escapeJson(*method.signatureText) << "\",\n";
            }

            if (method.returnType.has_value())
            {
                stream << "      \"returns\": \"" << escapeJson(*method.returnType) << "\",\n";
            }

            stream << "      \"doc\": \"" << escapeJson(method.documentation) << "\",\n";
            stream << "      \"line\": " << method.span.begin.line << ",\n";
            stream << "      \"parameters\": [";

            if (method.parameters.empty())
            {
                stream << "]\n";
            }
            else
            {
                stream << "\n";
                for (std::size_t index = 0; index < method.parameters.size(); ++index)
                {
                    writeParameter(stream, method.parameters[index]);
                    if (index + 1 < method.parameters.size())
                    {
                        stream << ",";
                    }
                    stream << "\n";
                }
                stream << "      ]\n";
            }

            stream << "    }";
        }
    } // namespace

    std::string renderDescriptorTable(const methods::MethodTable& table)
    {
        std::ostringstream stream;

        stream << "{\n";
        stream << "  \"methods\": [\n";

        for (std::size_t index = 0; index < table.methods.size(); ++index)
        {
            writeMethod(stream, table.methods[index]);
            if (index + 1 < table.methods.size())
            {
                stream << ",";
            }
            stream << "\n";
        }

        stream << "  ]\n";
        stream << "}\n";
        return stream.str();
    }

    bool writeDescriptorTable(const std::filesystem::path& outputPath,
        const methods::MethodTable& table,
        std::string& errorMessage)
    {
        const auto parentDirectory = outputPath.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + outputPath.string() + "': " + createError.message();
                return false;
            }
        }

        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + outputPath.string() + "' for writing.";
            return false;
        }

        file << renderDescriptorTable(table);
        if (!file.good())
        {
            errorMessage = "failed while writing descriptors to '" + outputPath.string() + "'.";
            return false;
        }

        return true;
    }
} // namespace sigcheck
