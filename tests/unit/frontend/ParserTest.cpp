#include <gtest/gtest.h>

#include "lexer.hpp"
#include "parser.hpp"

#include <string>
#include <vector>

namespace sigcheck::frontend
{
namespace
{
    SourceFile parseSource(const std::string& source, std::vector<Diagnostic>& diagnostics)
    {
        Lexer lexer{source, "parser-test"};
        lexer.lex();
        EXPECT_TRUE(lexer.diagnostics().empty()) << "Lexer diagnostics detected";

        Parser parser{lexer.tokens(), "parser-test"};
        SourceFile file = parser.parse();
        diagnostics = parser.diagnostics();
        return file;
    }

    TEST(ParserTest, ParsesImplAndModuleBlocks)
    {
        const std::string source = R"src(impl Widget {
    /// Builds one.
    #[staticmethod]
    #[text_signature = "(value)"]
    fn build(value: i32, other: impl Into<i32> = 3) -> Option<Vec<i32>>;

    fn read(&self) -> i32 { if ready { 1 } else { 2 } }
}

module helpers {
    fn helper(name: &str) {}
}
)src";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;

        ASSERT_EQ(file.blocks.size(), 2u);
        const auto& widget = file.blocks[0];
        EXPECT_EQ(widget.kind, BlockKind::Impl);
        EXPECT_EQ(widget.name, "Widget");
        ASSERT_EQ(widget.functions.size(), 2u);

        const auto& build = widget.functions[0];
        EXPECT_EQ(build.name, "build");
        ASSERT_EQ(build.docLines.size(), 1u);
        EXPECT_EQ(build.docLines.front(), "Builds one.");
        ASSERT_EQ(build.attributes.size(), 2u);
        EXPECT_EQ(build.attributes[0].name, "staticmethod");
        ASSERT_TRUE(build.attributes[1].assignedValue.has_value());
        EXPECT_EQ(*build.attributes[1].assignedValue, "(value)");
        EXPECT_EQ(build.receiver.form, ReceiverForm::None);
        ASSERT_EQ(build.parameters.size(), 2u);
        EXPECT_EQ(build.parameters[0].typeName, "i32");
        EXPECT_FALSE(build.parameters[0].typeIsImplTrait);
        EXPECT_EQ(build.parameters[1].typeName, "impl Into<i32>");
        EXPECT_TRUE(build.parameters[1].typeIsImplTrait);
        ASSERT_TRUE(build.parameters[1].defaultValue.has_value());
        EXPECT_EQ(*build.parameters[1].defaultValue, "3");
        ASSERT_TRUE(build.returnType.has_value());
        EXPECT_EQ(*build.returnType, "Option<Vec<i32>>");
        EXPECT_FALSE(build.hasBody);
        EXPECT_EQ(build.span.begin.line, 2u);

        const auto& read = widget.functions[1];
        EXPECT_EQ(read.receiver.form, ReceiverForm::Reference);
        EXPECT_TRUE(read.hasBody);
        EXPECT_TRUE(read.parameters.empty());

        const auto& helpers = file.blocks[1];
        EXPECT_EQ(helpers.kind, BlockKind::Module);
        EXPECT_EQ(helpers.name, "helpers");
        ASSERT_EQ(helpers.functions.size(), 1u);
        ASSERT_EQ(helpers.functions[0].parameters.size(), 1u);
        EXPECT_EQ(helpers.functions[0].parameters[0].typeName, "&str");
    }

    TEST(ParserTest, RecognizesEveryReceiverForm)
    {
        const std::string source = R"src(impl A {
    fn a(self);
    fn b(mut self);
    fn c(&self);
    fn d(&mut self);
    fn e(&'a self);
    fn f(&'a mut self, x: u8);
    fn g(x: u8);
})src";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty());
        ASSERT_EQ(file.blocks.size(), 1u);

        const auto& functions = file.blocks[0].functions;
        ASSERT_EQ(functions.size(), 7u);
        EXPECT_EQ(functions[0].receiver.form, ReceiverForm::Value);
        EXPECT_EQ(functions[1].receiver.form, ReceiverForm::Value);
        EXPECT_EQ(functions[2].receiver.form, ReceiverForm::Reference);
        EXPECT_EQ(functions[3].receiver.form, ReceiverForm::MutableReference);
        EXPECT_EQ(functions[4].receiver.form, ReceiverForm::Reference);
        EXPECT_EQ(functions[5].receiver.form, ReceiverForm::MutableReference);
        ASSERT_EQ(functions[5].parameters.size(), 1u);
        EXPECT_EQ(functions[5].parameters[0].name, "x");
        EXPECT_EQ(functions[6].receiver.form, ReceiverForm::None);

        const auto& receiverSpan = functions[3].receiver.span;
        EXPECT_EQ(receiverSpan.begin.line, 5u);
        EXPECT_EQ(receiverSpan.begin.column, 10u);
        EXPECT_EQ(receiverSpan.end.column, 19u);
    }

    TEST(ParserTest, RecordsGenericParameterForms)
    {
        const std::string source = R"src(impl A {
    fn g<'a, T: Clone + Send, const N: usize>(value: &'a T);
})src";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty());

        const auto& function = file.blocks[0].functions[0];
        ASSERT_EQ(function.genericParameters.size(), 3u);
        EXPECT_EQ(function.genericParameters[0].form, GenericParameterForm::Lifetime);
        EXPECT_EQ(function.genericParameters[1].form, GenericParameterForm::Type);
        EXPECT_EQ(function.genericParameters[1].name, "T");
        EXPECT_EQ(function.genericParameters[1].bounds, "Clone + Send");
        EXPECT_EQ(function.genericParameters[1].span.begin.column, 14u);
        EXPECT_EQ(function.genericParameters[2].form, GenericParameterForm::Constant);
        EXPECT_EQ(function.genericParameters[2].name, "N");
        ASSERT_EQ(function.parameters.size(), 1u);
        EXPECT_EQ(function.parameters[0].typeName, "&'a T");
    }

    TEST(ParserTest, ParsesAttributeArgumentLists)
    {
        const std::string source = R"src(impl A {
    #[args(a, b = 5, "*", c = "*", d = "**")]
    #[getter(value)]
    #[inline]
    fn f(&self);
})src";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty());

        const auto& attributes = file.blocks[0].functions[0].attributes;
        ASSERT_EQ(attributes.size(), 3u);

        const auto& args = attributes[0];
        EXPECT_TRUE(args.hasArgumentList);
        ASSERT_EQ(args.arguments.size(), 5u);
        EXPECT_TRUE(args.arguments[0].name.empty());
        EXPECT_EQ(args.arguments[0].value, "a");
        EXPECT_EQ(args.arguments[1].name, "b");
        EXPECT_EQ(args.arguments[1].value, "5");
        EXPECT_EQ(args.arguments[1].valueKind, TokenKind::IntegerLiteral);
        EXPECT_TRUE(args.arguments[2].name.empty());
        EXPECT_EQ(args.arguments[2].valueKind, TokenKind::StringLiteral);
        EXPECT_EQ(args.arguments[4].value, "**");

        ASSERT_EQ(attributes[1].arguments.size(), 1u);
        EXPECT_EQ(attributes[1].arguments[0].value, "value");
        EXPECT_FALSE(attributes[2].hasArgumentList);
        EXPECT_FALSE(attributes[2].assignedValue.has_value());
    }

    TEST(ParserTest, RecordsParameterTypeSpans)
    {
        const std::string source = R"src(impl A {
    fn h(x: impl Display, y: i32);
})src";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty());

        const auto& parameters = file.blocks[0].functions[0].parameters;
        ASSERT_EQ(parameters.size(), 2u);
        EXPECT_EQ(parameters[0].nameSpan.begin.column, 10u);
        EXPECT_EQ(parameters[0].typeSpan.begin.column, 13u);
        EXPECT_EQ(parameters[0].typeSpan.end.column, 25u);
        EXPECT_EQ(parameters[0].span.begin.column, 10u);
        EXPECT_EQ(parameters[1].typeSpan.begin.column, 30u);
    }

    TEST(ParserTest, AcceptsModuleAsParameterName)
    {
        const std::string source = "module counters { fn f(module: &PyModule, prefix: &str); }";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);
        ASSERT_TRUE(diagnostics.empty());

        ASSERT_EQ(file.blocks.size(), 1u);
        EXPECT_EQ(file.blocks[0].kind, BlockKind::Module);
        const auto& parameters = file.blocks[0].functions[0].parameters;
        ASSERT_EQ(parameters.size(), 2u);
        EXPECT_EQ(parameters[0].name, "module");
        EXPECT_EQ(parameters[0].nameSpan.begin.column, 24u);
        EXPECT_EQ(parameters[0].typeName, "&PyModule");
        EXPECT_EQ(parameters[1].name, "prefix");
    }

    TEST(ParserTest, ReportsReceiverAfterParameters)
    {
        const std::string source = "impl A { fn f(x: i32, &self); }";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "SIGCHECK-E1107");
        ASSERT_EQ(file.blocks.size(), 1u);
        ASSERT_EQ(file.blocks[0].functions.size(), 1u);
        EXPECT_EQ(file.blocks[0].functions[0].parameters.size(), 1u);
    }

    TEST(ParserTest, RecoversAfterStrayTokenInBlock)
    {
        const std::string source = "impl A { 42 fn ok(&self); }";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "SIGCHECK-E1104");
        ASSERT_EQ(file.blocks.size(), 1u);
        ASSERT_EQ(file.blocks[0].functions.size(), 1u);
        EXPECT_EQ(file.blocks[0].functions[0].name, "ok");
    }

    TEST(ParserTest, ReportsItemsOutsideBlocks)
    {
        const std::string source = "struct X; impl A { fn ok(&self); }";

        std::vector<Diagnostic> diagnostics;
        SourceFile file = parseSource(source, diagnostics);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "SIGCHECK-E1100");
        EXPECT_EQ(file.blocks.size(), 1u);
    }

    TEST(ParserTest, ReportsUnterminatedBody)
    {
        const std::string source = "impl A { fn f(&self) { if x { ";

        std::vector<Diagnostic> diagnostics;
        (void)parseSource(source, diagnostics);

        ASSERT_FALSE(diagnostics.empty());
        EXPECT_EQ(diagnostics.front().code, "SIGCHECK-E1116");
    }
} // namespace
} // namespace sigcheck::frontend
