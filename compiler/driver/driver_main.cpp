#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../methods/declaration_builder.hpp"
#include "../methods/method_table_checker.hpp"
#include "command_line.hpp"
#include "descriptor_writer.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef SIGCHECK_BUILD_PROFILE
#define SIGCHECK_BUILD_PROFILE "local"
#endif

namespace sigcheck
{
    void printHelp()
    {
        std::cout << "sigcheckc - method signature checker\n"
                  << "Usage: sigcheckc [options] <input>...\n\n"
                  << "Options:\n"
                  << "  --help                       Show this help text and exit.\n"
                  << "  --version                    Show version information and exit.\n"
                  << "  --quiet                      Suppress progress output; diagnostics are still printed.\n"
                  << "  --emit-descriptors=<path>    Write validated method descriptors as JSON (single input).\n"
                  << "  --emit-descriptors <path>    Same as above.\n"
                  << "  --constructor-name=<name>    Implicit constructor name. Default: __new__.\n"
                  << "  --module-type=<name>         First argument type for pass_module. Default: PyModule.\n"
                  << "  --type-object=<name>         First argument type for class methods. Default: PyType.\n";
    }

    void printVersion()
    {
        std::cout << "sigcheckc (build profile: " << SIGCHECK_BUILD_PROFILE << ")\n";
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    template <typename DiagnosticList>
    void printFrontendDiagnostics(const DiagnosticList& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << diagnostic.code << ' '
                      << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                      << " -> "
                      << diagnostic.message << '\n';
        }
    }

    void printMethodDiagnostics(const std::vector<methods::Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << diagnostic.code << ' '
                      << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                      << " -> "
                      << diagnostic.message << '\n';
            for (const auto& secondary : diagnostic.secondarySpans)
            {
                std::cerr << "    note: L" << secondary.begin.line << ":C" << secondary.begin.column
                          << " -> related location\n";
            }
        }
    }

    methods::CheckerOptions makeCheckerOptions(const CommandLineOptions& options)
    {
        methods::CheckerOptions checkerOptions;
        if (options.constructorName.has_value())
        {
            checkerOptions.constructorName = *options.constructorName;
        }
        if (options.moduleTypeName.has_value())
        {
            checkerOptions.moduleTypeName = *options.moduleTypeName;
        }
        if (options.typeObjectName.has_value())
        {
            checkerOptions.typeObjectName = *options.typeObjectName;
        }
        return checkerOptions;
    }

    // Returns true when the input produced no diagnostics.
    bool checkInput(const std::string& path,
        const methods::CheckerOptions& checkerOptions,
        const CommandLineOptions& options,
        std::ostream& log)
    {
        const auto content = loadFile(path);
        if (!content.has_value())
        {
            std::cerr << "SIGCHECK-E3000 InputReadFailed: unable to open '" << path << "'.\n";
            return false;
        }

        frontend::Lexer lexer{*content, path};
        lexer.lex();
        if (!lexer.diagnostics().empty())
        {
            printFrontendDiagnostics(lexer.diagnostics());
            return false;
        }

        const auto& tokens = lexer.tokens();
        log << "[notice] Lexed " << tokens.size() << " tokens from '" << path << "'.\n";

        frontend::Parser parser{tokens, path};
        const frontend::SourceFile file = parser.parse();
        if (!parser.diagnostics().empty())
        {
            printFrontendDiagnostics(parser.diagnostics());
            return false;
        }

        // A declaration with an undecodable attribute is skipped by the
        // checker; the rest of the file is still checked.
        methods::DeclarationBuilder builder{file};
        const std::vector<methods::Declaration> declarations = builder.build();
        printMethodDiagnostics(builder.diagnostics());

        log << "[notice] Collected " << declarations.size() << " declaration(s) from "
            << file.blocks.size() << " block(s).\n";

        methods::MethodTableChecker checker{declarations, checkerOptions};
        const methods::MethodTable table = checker.check();
        printMethodDiagnostics(checker.diagnostics());
        if (!builder.diagnostics().empty() || !checker.diagnostics().empty())
        {
            return false;
        }

        log << "[notice] Validated " << table.methods.size() << " method(s).\n";
        for (const auto& method : table.methods)
        {
            log << "    " << method.ownerName << "::" << method.exposedName
                << " (" << methods::toString(method.role) << ")\n";
        }

        if (options.descriptorOutputPath.has_value())
        {
            std::string errorMessage;
            if (!writeDescriptorTable(*options.descriptorOutputPath, table, errorMessage))
            {
                std::cerr << "SIGCHECK-E3001 DescriptorWriteFailed: " << errorMessage << "\n";
                return false;
            }
            log << "[notice] Descriptors written to " << *options.descriptorOutputPath << "\n";
        }

        return true;
    }

    int runChecker(const CommandLineOptions& options)
    {
        if (options.descriptorOutputPath.has_value() && options.inputPaths.size() > 1)
        {
            std::cerr << "SIGCHECK-E3002 DescriptorSingleInput: --emit-descriptors requires a single input file.\n";
            return 1;
        }

        std::ostringstream discarded;
        std::ostream& log = options.quiet ? static_cast<std::ostream&>(discarded) : std::cout;

        log << "[information] Starting sigcheckc.\n";
        for (const auto& path : options.inputPaths)
        {
            log << "  input: " << path << "\n";
        }

        const methods::CheckerOptions checkerOptions = makeCheckerOptions(options);

        int exitCode = 0;
        for (const auto& path : options.inputPaths)
        {
            if (!checkInput(path, checkerOptions, options, log))
            {
                exitCode = 1;
            }
        }

        if (exitCode == 0)
        {
            log << "[notice] All declarations validated.\n";
        }
        else
        {
            log << "[information] Validation finished with diagnostics.\n";
        }

        return exitCode;
    }
} // namespace sigcheck

int main(int argc, char** argv)
{
    sigcheck::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        sigcheck::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        sigcheck::printVersion();
        return 0;
    }

    return sigcheck::runChecker(options.value());
}
