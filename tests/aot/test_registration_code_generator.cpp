// tests/aot/test_registration_code_generator.cpp
#define BOOST_TEST_MODULE RegistrationCodeGeneratorTests
#include <boost/test/unit_test.hpp>

#include <limits>
#include <memory>
#include <string>

#include "sprig/aot/exceptions.hpp"
#include "sprig/aot/registration_code_generator.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"

using namespace sprig::aot;
using namespace sprig::beans;

namespace codegen_test {

struct Port {
    virtual ~Port() = default;
};

struct Socket : Port {
    void set_property(const std::string&, const ResolvedValue&) {}
};

std::shared_ptr<Socket> open_socket(std::string host, int port) {
    static_cast<void>(host);
    static_cast<void>(port);
    return std::make_shared<Socket>();
}

}  // namespace codegen_test

namespace {

struct Hidden {};

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(LiteralSuite)

BOOST_AUTO_TEST_CASE(test_string_literal_escaping) {
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::string_literal("plain"),
                      "\"plain\"");
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::string_literal("a\"b\\c"),
                      "\"a\\\"b\\\\c\"");
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::string_literal("line\n"),
                      "\"line\\n\"");
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::string_literal("\x01"),
                      "\"\\001\"");
}

BOOST_AUTO_TEST_CASE(test_literal_expressions) {
    BOOST_CHECK_EQUAL(
        RegistrationCodeGenerator::literal_expression(Literal{true}),
        "sprig::beans::Literal{true}");
    BOOST_CHECK_EQUAL(
        RegistrationCodeGenerator::literal_expression(Literal{std::int64_t{-5}}),
        "sprig::beans::Literal{std::int64_t{-5}}");
    BOOST_CHECK_EQUAL(
        RegistrationCodeGenerator::literal_expression(Literal{2.0}),
        "sprig::beans::Literal{2.0}");
    BOOST_CHECK_EQUAL(
        RegistrationCodeGenerator::literal_expression(Literal{0.5}),
        "sprig::beans::Literal{0.5}");
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::literal_expression(
                          Literal{std::numeric_limits<double>::infinity()}),
                      "sprig::beans::Literal{std::numeric_limits<double>::"
                      "infinity()}");
    BOOST_CHECK_EQUAL(
        RegistrationCodeGenerator::literal_expression(Literal{std::string("hi")}),
        "sprig::beans::Literal{std::string(\"hi\")}");
}

BOOST_AUTO_TEST_CASE(test_argument_expressions) {
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::argument_expression(
                          ArgumentSpec::reference("db")),
                      "sprig::beans::ArgumentSpec::reference(\"db\")");
    BOOST_CHECK_EQUAL(RegistrationCodeGenerator::argument_expression(
                          ArgumentSpec::of_type<codegen_test::Port>()),
                      "sprig::beans::ArgumentSpec::of_type<codegen_test::Port>()");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GeneratorSuite)

BOOST_AUTO_TEST_CASE(test_registrar_expression_reproduces_definition) {
    auto definition =
        BeanDefinitionRegistrar<codegen_test::Socket>::of("socket")
            .exposes<codegen_test::Port>()
            .with_factory_method(
                "codegen_test::open_socket", &codegen_test::open_socket,
                {ArgumentSpec::literal(std::string("localhost")),
                 ArgumentSpec::literal(std::int64_t{8080})})
            .property("timeout", 30)
            .reference("peer", "otherSocket")
            .qualifier("net")
            .primary()
            .lazy()
            .description("Main socket")
            .declared_in("net/socket.hpp")
            .to_definition();

    const std::string code =
        RegistrationCodeGenerator::registrar_expression(*definition, 4);
    BOOST_CHECK(contains(code,
                         "sprig::beans::BeanDefinitionRegistrar<"
                         "codegen_test::Socket>::of(\"socket\")"));
    BOOST_CHECK(contains(code, ".exposes<codegen_test::Port>()"));
    BOOST_CHECK(contains(code,
                         ".with_factory_method(\"codegen_test::open_socket\", "
                         "&codegen_test::open_socket, {"));
    BOOST_CHECK(contains(code, "std::int64_t{8080}"));
    BOOST_CHECK(contains(code,
                         ".property(\"timeout\", sprig::beans::PropertyValue::"
                         "literal(sprig::beans::Literal{std::int64_t{30}}))"));
    BOOST_CHECK(contains(code, ".reference(\"peer\", \"otherSocket\")"));
    BOOST_CHECK(contains(code, ".qualifier(\"net\")"));
    BOOST_CHECK(contains(code, ".primary()"));
    BOOST_CHECK(contains(code, ".lazy()"));
    BOOST_CHECK(contains(code, ".description(\"Main socket\")"));
    BOOST_CHECK(contains(code, ".declared_in(\"net/socket.hpp\")"));
}

BOOST_AUTO_TEST_CASE(test_inner_bean_is_nested) {
    auto definition =
        BeanDefinitionRegistrar<codegen_test::Socket>::of("outer")
            .property("inner", BeanDefinitionRegistrar<codegen_test::Socket>::inner()
                                   .declared_in("net/inner.hpp"))
            .declared_in("net/socket.hpp")
            .to_definition();

    const std::string code =
        RegistrationCodeGenerator::registrar_expression(*definition, 4);
    BOOST_CHECK(contains(code,
                         "sprig::beans::BeanDefinitionRegistrar<"
                         "codegen_test::Socket>::inner()"));

    RegistrationCodeGenerator generator("Default_BeanRegistrations", "default");
    generator.add(definition);
    const std::string source = generator.generate_source();
    BOOST_CHECK(contains(source, "#include \"net/inner.hpp\"\n"
                                 "#include \"net/socket.hpp\"\n"));
}

BOOST_AUTO_TEST_CASE(test_generated_files_content) {
    RegistrationCodeGenerator generator("Default_BeanRegistrations", "default",
                                        {"extra/common.hpp"});
    generator.add(BeanDefinitionRegistrar<codegen_test::Socket>::of("a")
                      .declared_in("net/socket.hpp")
                      .to_definition());
    generator.add(BeanDefinitionRegistrar<codegen_test::Socket>::of("b")
                      .declared_in("net/socket.hpp")
                      .to_definition());

    BOOST_CHECK_EQUAL(generator.header_path(),
                      "sprig_generated/Default_BeanRegistrations.hpp");
    BOOST_CHECK_EQUAL(generator.source_path(),
                      "sprig_generated/Default_BeanRegistrations.cpp");

    const std::string header = generator.generate_header();
    BOOST_CHECK(contains(header, "#pragma once"));
    BOOST_CHECK(contains(header,
                         "class Default_BeanRegistrations : public "
                         "sprig::aot::RegistrationInitializer"));

    const std::string source = generator.generate_source();
    BOOST_CHECK(contains(
        source, "#include \"sprig_generated/Default_BeanRegistrations.hpp\""));
    BOOST_CHECK(contains(source, "#include \"extra/common.hpp\"\n"
                                 "#include \"net/socket.hpp\"\n\n"));
    BOOST_CHECK(contains(
        source, "return \"sprig_generated::Default_BeanRegistrations\";"));
    BOOST_CHECK(contains(source, "// Bean \"a\""));
    BOOST_CHECK(contains(source, "// Bean \"b\""));
    BOOST_CHECK(source.find("// Bean \"a\"") < source.find("// Bean \"b\""));
    BOOST_CHECK(contains(source, ".register_with(registry);"));
}

BOOST_AUTO_TEST_CASE(test_empty_generator_still_compiles) {
    RegistrationCodeGenerator generator("Empty_BeanRegistrations", "empty");
    BOOST_CHECK(contains(generator.generate_source(),
                         "static_cast<void>(registry);"));
}

BOOST_AUTO_TEST_CASE(test_instance_supplier_is_rejected) {
    RegistrationCodeGenerator generator("Default_BeanRegistrations", "default");
    auto definition =
        BeanDefinitionRegistrar<codegen_test::Socket>::of("supplied")
            .with_instance_supplier(
                [] { return std::make_shared<codegen_test::Socket>(); })
            .to_definition();
    BOOST_CHECK_THROW(generator.add(definition), AotProcessingError);
    BOOST_CHECK_EQUAL(generator.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_unnameable_type_is_rejected) {
    RegistrationCodeGenerator generator("Default_BeanRegistrations", "default");
    auto definition = BeanDefinitionRegistrar<Hidden>::of("hidden").to_definition();
    BOOST_CHECK_THROW(generator.add(definition), AotProcessingError);
}

BOOST_AUTO_TEST_SUITE_END()
