#include <gtest/gtest.h>

#include "command_line.hpp"

#include <iterator>

namespace
{
    TEST(CommandLineParserTest, ParsesInputsAndDefaults)
    {
        const char* argv[] = {
            "sigcheckc",
            "widgets.sig",
            "helpers.sig"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->inputPaths.size(), 2u);
        EXPECT_EQ(options->inputPaths.front(), "widgets.sig");
        EXPECT_FALSE(options->quiet);
        EXPECT_FALSE(options->descriptorOutputPath.has_value());
        EXPECT_FALSE(options->constructorName.has_value());
    }

    TEST(CommandLineParserTest, ParsesEmitDescriptorsEqualsForm)
    {
        const char* argv[] = {
            "sigcheckc",
            "--emit-descriptors=out/methods.json",
            "input.sig"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_TRUE(options->descriptorOutputPath.has_value());
        EXPECT_EQ(*options->descriptorOutputPath, "out/methods.json");
    }

    TEST(CommandLineParserTest, ParsesEmitDescriptorsSeparateArgument)
    {
        const char* argv[] = {
            "sigcheckc",
            "--emit-descriptors",
            "methods.json",
            "input.sig"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_TRUE(options->descriptorOutputPath.has_value());
        EXPECT_EQ(*options->descriptorOutputPath, "methods.json");
        ASSERT_EQ(options->inputPaths.size(), 1u);
    }

    TEST(CommandLineParserTest, MissingEmitDescriptorsValueFails)
    {
        const char* argv[] = {
            "sigcheckc",
            "--emit-descriptors"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, ParsesCheckerNames)
    {
        const char* argv[] = {
            "sigcheckc",
            "--quiet",
            "--constructor-name=create",
            "--module-type=Bound",
            "--type-object=Kind",
            "input.sig"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->quiet);
        EXPECT_EQ(options->constructorName.value_or(""), "create");
        EXPECT_EQ(options->moduleTypeName.value_or(""), "Bound");
        EXPECT_EQ(options->typeObjectName.value_or(""), "Kind");
    }

    TEST(CommandLineParserTest, EmptyCheckerNameFails)
    {
        const char* argv[] = {
            "sigcheckc",
            "--constructor-name=",
            "input.sig"
        };

        sigcheck::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv)).has_value());
    }

    TEST(CommandLineParserTest, UnknownOptionFails)
    {
        const char* argv[] = {
            "sigcheckc",
            "--strict",
            "input.sig"
        };

        sigcheck::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv)).has_value());
    }

    TEST(CommandLineParserTest, MissingInputFails)
    {
        const char* argv[] = {
            "sigcheckc",
            "--quiet"
        };

        sigcheck::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv)).has_value());
    }

    TEST(CommandLineParserTest, HelpNeedsNoInput)
    {
        const char* argv[] = {
            "sigcheckc",
            "--help"
        };

        sigcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->showHelp);
    }
} // namespace
