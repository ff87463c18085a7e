#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "declaration_builder.hpp"
#include "lexer.hpp"
#include "method_table_checker.hpp"
#include "parser.hpp"

namespace
{
    std::vector<sigcheck::methods::Declaration> buildDeclarations(const std::string& source)
    {
        sigcheck::frontend::Lexer lexer{source, "descriptor-test"};
        lexer.lex();
        EXPECT_TRUE(lexer.diagnostics().empty()) << "Lexer diagnostics detected";

        sigcheck::frontend::Parser parser{lexer.tokens(), "descriptor-test"};
        const sigcheck::frontend::SourceFile file = parser.parse();
        EXPECT_TRUE(parser.diagnostics().empty()) << "Parser diagnostics detected";

        sigcheck::methods::DeclarationBuilder builder{file};
        auto declarations = builder.build();
        EXPECT_TRUE(builder.diagnostics().empty()) << "Decoding diagnostics detected";
        return declarations;
    }
}

namespace sigcheck::methods
{
namespace
{
    MethodDescriptor describeSingle(const std::string& source, const CheckerOptions& options = {})
    {
        const auto declarations = buildDeclarations(source);
        if (declarations.size() != 1u)
        {
            ADD_FAILURE() << "Expected one declaration, got " << declarations.size();
            return MethodDescriptor{};
        }

        DiagnosticEmitter emitter;
        auto descriptor = checkDeclaration(declarations.front(), options, emitter);
        if (!emitter.empty())
        {
            const Diagnostic& first = emitter.diagnostics().front();
            ADD_FAILURE() << "First diagnostic: " << first.code << " - " << first.message;
        }
        return descriptor.value_or(MethodDescriptor{});
    }

    TEST(MethodDescriptorTest, DescribesInstanceMethod)
    {
        const auto descriptor = describeSingle(R"src(impl Counter {
    /// Adds to the counter.
    fn add(&mut self, amount: i32, label: Option<String>, step: u8 = 1) -> i32;
})src");

        EXPECT_EQ(descriptor.sourceName, "add");
        EXPECT_EQ(descriptor.exposedName, "add");
        EXPECT_EQ(descriptor.role, MethodRole::Instance);
        EXPECT_EQ(descriptor.receiver, ReceiverKind::ByMutableReference);
        EXPECT_EQ(descriptor.ownerName, "Counter");
        EXPECT_EQ(descriptor.documentation, "Adds to the counter.");
        EXPECT_FALSE(descriptor.signatureText.has_value());
        ASSERT_TRUE(descriptor.returnType.has_value());
        EXPECT_EQ(*descriptor.returnType, "i32");

        ASSERT_EQ(descriptor.parameters.size(), 3u);
        EXPECT_FALSE(descriptor.parameters[0].isOptional);
        EXPECT_TRUE(descriptor.parameters[1].isOptional) << "Option<...> parameters are optional";
        EXPECT_EQ(descriptor.parameters[1].typeText, "Option<String>");
        EXPECT_TRUE(descriptor.parameters[2].isOptional);
    }

    TEST(MethodDescriptorTest, ComposesDocumentationWithSignature)
    {
        const auto descriptor = describeSingle(R"src(impl Counter {
    /// Resets the counter.
    ///
    /// Returns the old value.
    #[text_signature = "($self, value)"]
    fn reset(&self, value: i32) -> i32;
})src");

        ASSERT_TRUE(descriptor.signatureText.has_value());
        EXPECT_EQ(*descriptor.signatureText, "($self, value)");
        EXPECT_EQ(descriptor.documentation, "reset($self, value)\n--\n\nResets the counter.\n\nReturns the old value.");
    }

    TEST(MethodDescriptorTest, StripsAccessorPrefixes)
    {
        const auto getter = describeSingle(R"src(impl Counter {
    #[getter]
    fn get_total(&self) -> i32;
})src");
        EXPECT_EQ(getter.role, MethodRole::Getter);
        EXPECT_EQ(getter.exposedName, "total");

        const auto setter = describeSingle(R"src(impl Counter {
    #[setter]
    fn set_total(&mut self, value: i32);
})src");
        EXPECT_EQ(setter.role, MethodRole::Setter);
        EXPECT_EQ(setter.exposedName, "total");

        const auto bare = describeSingle(R"src(impl Counter {
    #[getter]
    fn get_(&self) -> i32;
})src");
        EXPECT_EQ(bare.exposedName, "get_") << "a name that is only the prefix is kept";
    }

    TEST(MethodDescriptorTest, ExplicitNamesWinOverPrefixStripping)
    {
        const auto fromMarker = describeSingle(R"src(impl Counter {
    #[getter(count)]
    fn get_total(&self) -> i32;
})src");
        EXPECT_EQ(fromMarker.exposedName, "count");

        const auto fromOverride = describeSingle(R"src(impl Counter {
    #[staticmethod]
    #[name = "create"]
    fn build(value: i32) -> Counter;
})src");
        EXPECT_EQ(fromOverride.exposedName, "create");
        EXPECT_EQ(fromOverride.sourceName, "build");
    }

    TEST(MethodDescriptorTest, TreatsQualifiedOptionPathsAsOptional)
    {
        const auto descriptor = describeSingle(R"src(impl Counter {
    fn merge(&self, a: std::option::Option<i32>, b: core::option::Option<u8>, c: Optional<i32>);
})src");

        ASSERT_EQ(descriptor.parameters.size(), 3u);
        EXPECT_EQ(descriptor.parameters[0].typeText, "std::option::Option<i32>");
        EXPECT_TRUE(descriptor.parameters[0].isOptional);
        EXPECT_TRUE(descriptor.parameters[1].isOptional);
        EXPECT_FALSE(descriptor.parameters[2].isOptional);
    }

    TEST(MethodDescriptorTest, SkipsImplicitLeadingParameters)
    {
        const auto classMethod = describeSingle(R"src(impl Counter {
    #[classmethod]
    fn from_value(cls: &PyType, value: i32) -> Counter;
})src");
        EXPECT_EQ(classMethod.role, MethodRole::ClassMethod);
        ASSERT_EQ(classMethod.parameters.size(), 1u);
        EXPECT_EQ(classMethod.parameters[0].name, "value");

        const auto freeFunction = describeSingle(R"src(module counters {
    #[pass_module]
    fn module_name(module: &PyModule, prefix: &str) -> String;
})src");
        EXPECT_EQ(freeFunction.role, MethodRole::FreeFunction);
        EXPECT_EQ(freeFunction.scope, DeclarationScope::ModuleScope);
        EXPECT_TRUE(freeFunction.passModule);
        ASSERT_EQ(freeFunction.parameters.size(), 1u);
        EXPECT_EQ(freeFunction.parameters[0].name, "prefix");
    }

    TEST(MethodDescriptorTest, AppliesArgumentListToParameters)
    {
        const auto descriptor = describeSingle(R"src(impl Counter {
    #[args(first, "*", second = 2)]
    fn configure(&self, first: i32, second: i32);

})src");

        ASSERT_EQ(descriptor.parameters.size(), 2u);
        EXPECT_FALSE(descriptor.parameters[0].keywordOnly);
        EXPECT_FALSE(descriptor.parameters[0].isOptional);
        EXPECT_TRUE(descriptor.parameters[1].keywordOnly);
        EXPECT_TRUE(descriptor.parameters[1].isOptional);

        const auto variadic = describeSingle(R"src(impl Counter {
    #[args(items = "*", options = "**")]
    fn collect(&self, items: Vec<i32>, options: Map);
})src");
        ASSERT_EQ(variadic.parameters.size(), 2u);
        EXPECT_TRUE(variadic.parameters[0].isVarArgs);
        EXPECT_TRUE(variadic.parameters[0].isOptional);
        EXPECT_TRUE(variadic.parameters[1].isKeywordArgs);
        EXPECT_FALSE(variadic.parameters[1].keywordOnly);
    }

    TEST(MethodDescriptorTest, InfersConstructor)
    {
        const auto descriptor = describeSingle(R"src(impl Counter {
    fn __new__() -> Counter;
})src");

        EXPECT_EQ(descriptor.role, MethodRole::New);
        EXPECT_EQ(descriptor.receiver, ReceiverKind::None);
    }
} // namespace
} // namespace sigcheck::methods
