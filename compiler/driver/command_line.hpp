#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigcheck
{
    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        bool showHelp{false};
        bool showVersion{false};
        bool quiet{false};
        std::optional<std::string> descriptorOutputPath;
        std::optional<std::string> constructorName;
        std::optional<std::string> moduleTypeName;
        std::optional<std::string> typeObjectName;
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--quiet")
                {
                    options.quiet = true;
                    continue;
                }

                if (argument.rfind("--emit-descriptors=", 0) == 0)
                {
                    constexpr std::string_view descriptorOpt = "--emit-descriptors=";
                    const auto value = argument.substr(descriptorOpt.size());
                    if (value.empty())
                    {
                        std::cerr << "SIGCHECK-E0103 MissingDescriptorPath: expected path after --emit-descriptors option.\n";
                        return std::nullopt;
                    }
                    options.descriptorOutputPath = std::string{value};
                    continue;
                }

                if (argument == "--emit-descriptors")
                {
                    if (index + 1 < argc)
                    {
                        options.descriptorOutputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "SIGCHECK-E0103 MissingDescriptorPath: expected path after --emit-descriptors option.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--constructor-name=", 0) == 0)
                {
                    if (!assignName(argument, "--constructor-name=", options.constructorName))
                    {
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--module-type=", 0) == 0)
                {
                    if (!assignName(argument, "--module-type=", options.moduleTypeName))
                    {
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--type-object=", 0) == 0)
                {
                    if (!assignName(argument, "--type-object=", options.typeObjectName))
                    {
                        return std::nullopt;
                    }
                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "SIGCHECK-E0101 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (!options.showHelp && !options.showVersion && options.inputPaths.empty())
            {
                std::cerr << "SIGCHECK-E0102 MissingInput: at least one input file is required.\n";
                return std::nullopt;
            }

            return options;
        }

    private:
        static bool assignName(std::string_view argument, std::string_view prefix, std::optional<std::string>& target)
        {
            const auto value = argument.substr(prefix.size());
            if (value.empty())
            {
                std::cerr << "SIGCHECK-E0104 MissingOptionValue: expected a name after '" << prefix << "'.\n";
                return false;
            }

            target = std::string{value};
            return true;
        }
    };
} // namespace sigcheck
