#include "sprig/aot/registration_code_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

#include "sprig/aot/class_name_generator.hpp"
#include "sprig/aot/exceptions.hpp"

namespace sprig::aot {

namespace {

const char* const GENERATED_NOTICE =
    "// Generated by sprig AOT processing. Do not edit.\n";

std::string describe(const beans::BeanDefinition& definition,
                     const std::string& owner) {
    if (!definition.is_inner()) return "bean '" + definition.name() + "'";
    return "inner bean of type " + definition.type().name() + " in '" +
           owner + "'";
}

void check_type_name(const std::string& type_name, const std::string& what) {
    if (type_name.find("anonymous") != std::string::npos ||
        type_name.find("lambda") != std::string::npos) {
        throw AotProcessingError("Cannot generate code for " + what +
                                 ": type " + type_name +
                                 " cannot be named from another file");
    }
}

}  // namespace

RegistrationCodeGenerator::RegistrationCodeGenerator(
    std::string class_name, std::string factory_name,
    std::vector<std::string> extra_includes)
    : class_name_(std::move(class_name)),
      factory_name_(std::move(factory_name)),
      extra_includes_(std::move(extra_includes)) {}

void RegistrationCodeGenerator::add(
    std::shared_ptr<const beans::BeanDefinition> definition) {
    if (!definition) {
        throw AotProcessingError("Cannot generate code for a null definition");
    }
    check_expressible(*definition, definition->name());
    definitions_.push_back(std::move(definition));
}

void RegistrationCodeGenerator::check_expressible(
    const beans::BeanDefinition& definition, const std::string& owner) {
    const std::string what = describe(definition, owner);
    check_type_name(definition.type().name(), what);
    for (const auto& exposed : definition.exposed_types()) {
        check_type_name(exposed.type.name(), what);
    }

    const auto& strategy = definition.construction_strategy();
    if (!strategy) {
        throw AotProcessingError("Cannot generate code for " + what +
                                 ": no construction strategy");
    }
    if (auto factory =
            std::dynamic_pointer_cast<const beans::FactoryMethod>(strategy)) {
        if (!factory->has_qualified_name()) {
            throw AotProcessingError(
                "Cannot generate code for " + what +
                ": it is created by an instance supplier; register it with "
                "with_factory_method() and a qualified function name");
        }
        for (const auto& argument : factory->arguments()) {
            if (argument.kind() == beans::ArgumentSpec::Kind::TYPE_REFERENCE) {
                check_type_name(argument.reference_type().name(), what);
            }
        }
    }

    for (const auto& [property_name, value] : definition.property_values()) {
        if (value.is_inner_bean()) {
            check_expressible(*value.inner_definition(), owner);
        }
    }
}

std::string RegistrationCodeGenerator::header_path_for(
    const std::string& class_name) {
    return std::string(ClassNameGenerator::NAMESPACE) + "/" + class_name +
           ".hpp";
}

std::string RegistrationCodeGenerator::header_path() const {
    return header_path_for(class_name_);
}

std::string RegistrationCodeGenerator::source_path() const {
    return std::string(ClassNameGenerator::NAMESPACE) + "/" + class_name_ +
           ".cpp";
}

std::string RegistrationCodeGenerator::string_literal(const std::string& value) {
    std::string result = "\"";
    for (unsigned char c : value) {
        switch (c) {
            case '\\':
                result += "\\\\";
                break;
            case '"':
                result += "\\\"";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\r':
                result += "\\r";
                break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    char escaped[5];
                    std::snprintf(escaped, sizeof(escaped), "\\%03o", c);
                    result += escaped;
                } else {
                    result.push_back(static_cast<char>(c));
                }
        }
    }
    result += "\"";
    return result;
}

std::string RegistrationCodeGenerator::literal_expression(
    const beans::Literal& literal) {
    std::string value;
    if (auto b = std::get_if<bool>(&literal)) {
        value = *b ? "true" : "false";
    } else if (auto i = std::get_if<std::int64_t>(&literal)) {
        value = *i == std::numeric_limits<std::int64_t>::min()
                    ? "std::numeric_limits<std::int64_t>::min()"
                    : "std::int64_t{" + std::to_string(*i) + "}";
    } else if (auto d = std::get_if<double>(&literal)) {
        if (std::isnan(*d)) {
            value = "std::numeric_limits<double>::quiet_NaN()";
        } else if (std::isinf(*d)) {
            value = *d > 0 ? "std::numeric_limits<double>::infinity()"
                           : "-std::numeric_limits<double>::infinity()";
        } else {
            std::ostringstream out;
            out << std::setprecision(std::numeric_limits<double>::max_digits10)
                << *d;
            value = out.str();
            if (value.find_first_of(".e") == std::string::npos) value += ".0";
        }
    } else {
        value = "std::string(" + string_literal(std::get<std::string>(literal)) +
                ")";
    }
    return "sprig::beans::Literal{" + value + "}";
}

std::string RegistrationCodeGenerator::argument_expression(
    const beans::ArgumentSpec& argument) {
    switch (argument.kind()) {
        case beans::ArgumentSpec::Kind::LITERAL:
            return "sprig::beans::ArgumentSpec::literal(" +
                   literal_expression(argument.as_literal()) + ")";
        case beans::ArgumentSpec::Kind::REFERENCE:
            return "sprig::beans::ArgumentSpec::reference(" +
                   string_literal(argument.reference_name()) + ")";
        case beans::ArgumentSpec::Kind::TYPE_REFERENCE:
            return "sprig::beans::ArgumentSpec::of_type<" +
                   argument.reference_type().name() + ">()";
    }
    throw AotProcessingError("Unsupported factory argument");
}

std::string RegistrationCodeGenerator::registrar_expression(
    const beans::BeanDefinition& definition, int indent) {
    const std::string next_line = "\n" + std::string(indent + 4, ' ');
    std::ostringstream out;

    out << "sprig::beans::BeanDefinitionRegistrar<" << definition.type().name()
        << ">::";
    if (definition.is_inner()) {
        out << "inner()";
    } else {
        out << "of(" << string_literal(definition.name()) << ")";
    }

    for (const auto& exposed : definition.exposed_types()) {
        out << next_line << ".exposes<" << exposed.type.name() << ">()";
    }

    if (auto factory = std::dynamic_pointer_cast<const beans::FactoryMethod>(
            definition.construction_strategy())) {
        out << next_line << ".with_factory_method("
            << string_literal(factory->qualified_name()) << ", &"
            << factory->qualified_name();
        if (!factory->arguments().empty()) {
            out << ", {";
            for (size_t i = 0; i < factory->arguments().size(); ++i) {
                if (i > 0) out << ", ";
                out << argument_expression(factory->arguments()[i]);
            }
            out << "}";
        }
        out << ")";
    }

    for (const auto& [property_name, value] : definition.property_values()) {
        out << next_line << ".";
        switch (value.kind()) {
            case beans::PropertyValue::Kind::LITERAL:
                out << "property(" << string_literal(property_name)
                    << ", sprig::beans::PropertyValue::literal("
                    << literal_expression(value.as_literal()) << "))";
                break;
            case beans::PropertyValue::Kind::REFERENCE:
                out << "reference(" << string_literal(property_name) << ", "
                    << string_literal(value.reference_name()) << ")";
                break;
            case beans::PropertyValue::Kind::INNER_BEAN:
                out << "property(" << string_literal(property_name) << ","
                    << "\n" << std::string(indent + 8, ' ')
                    << registrar_expression(*value.inner_definition(),
                                            indent + 8)
                    << ")";
                break;
        }
    }

    for (const auto& qualifier : definition.qualifiers()) {
        out << next_line << ".qualifier(" << string_literal(qualifier) << ")";
    }
    if (definition.is_primary()) out << next_line << ".primary()";
    if (definition.is_lazy_init()) out << next_line << ".lazy()";
    if (!definition.description().empty()) {
        out << next_line << ".description("
            << string_literal(definition.description()) << ")";
    }
    if (!definition.declaring_header().empty()) {
        out << next_line << ".declared_in("
            << string_literal(definition.declaring_header()) << ")";
    }
    return out.str();
}

void RegistrationCodeGenerator::collect_includes(
    const beans::BeanDefinition& definition,
    std::vector<std::string>& includes) const {
    if (!definition.declaring_header().empty()) {
        includes.push_back(definition.declaring_header());
    }
    for (const auto& [property_name, value] : definition.property_values()) {
        if (value.is_inner_bean()) {
            collect_includes(*value.inner_definition(), includes);
        }
    }
}

std::string RegistrationCodeGenerator::generate_header() const {
    std::ostringstream out;
    out << GENERATED_NOTICE << "#pragma once\n\n"
        << "#include <string>\n\n"
        << "#include \"sprig/aot/registration_initializer.hpp\"\n\n"
        << "namespace " << ClassNameGenerator::NAMESPACE << " {\n\n"
        << "// Bean registrations of the " << string_literal(factory_name_)
        << " bean factory\n"
        << "class " << class_name_
        << " : public sprig::aot::RegistrationInitializer {\n"
        << "public:\n"
        << "    std::string name() const override;\n"
        << "    void initialize(sprig::beans::BeanRegistry& registry) "
           "override;\n"
        << "};\n\n"
        << "}  // namespace " << ClassNameGenerator::NAMESPACE << "\n";
    return out.str();
}

std::string RegistrationCodeGenerator::generate_source() const {
    std::vector<std::string> includes = extra_includes_;
    for (const auto& definition : definitions_) {
        collect_includes(*definition, includes);
    }
    std::sort(includes.begin(), includes.end());
    includes.erase(std::unique(includes.begin(), includes.end()),
                   includes.end());

    std::ostringstream out;
    out << GENERATED_NOTICE << "#include \"" << header_path() << "\"\n\n"
        << "#include <cstdint>\n"
        << "#include <limits>\n"
        << "#include <string>\n\n"
        << "#include \"sprig/beans/bean_definition_registrar.hpp\"\n";
    for (const auto& include : includes) {
        out << "#include \"" << include << "\"\n";
    }

    out << "\nnamespace " << ClassNameGenerator::NAMESPACE << " {\n\n"
        << "std::string " << class_name_ << "::name() const {\n"
        << "    return " << string_literal(ClassNameGenerator::qualify(class_name_))
        << ";\n"
        << "}\n\n"
        << "void " << class_name_
        << "::initialize(sprig::beans::BeanRegistry& registry) {\n";
    if (definitions_.empty()) {
        out << "    static_cast<void>(registry);\n";
    }
    for (size_t i = 0; i < definitions_.size(); ++i) {
        if (i > 0) out << "\n";
        out << "    // Bean " << string_literal(definitions_[i]->name()) << "\n"
            << "    " << registrar_expression(*definitions_[i], 4) << "\n"
            << "        .register_with(registry);\n";
    }
    out << "}\n\n"
        << "}  // namespace " << ClassNameGenerator::NAMESPACE << "\n";
    return out.str();
}

}  // namespace sprig::aot
