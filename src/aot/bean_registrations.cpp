#include "sprig/aot/bean_registrations.hpp"

#include <sstream>

#include "sprig/aot/class_name_generator.hpp"
#include "sprig/aot/registration_code_generator.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::aot {

void BeanRegistrationsAotProcessor::process(
    const std::string& factory_name, const beans::BeanContainer& container,
    ContributionQueue& queue) {
    std::vector<std::shared_ptr<const beans::BeanDefinition>> definitions;
    for (const auto& name : container.aot_visible_definition_names()) {
        definitions.push_back(container.get_definition(name));
    }
    if (definitions.empty()) {
        SPRIG_LOG_INFO << "No bean definitions to generate for factory '"
                       << factory_name << "'";
        return;
    }
    SPRIG_LOG_DEBUG << "Queueing registrations of " << definitions.size()
                    << " beans for factory '" << factory_name << "'";
    queue.enqueue(std::make_unique<BeanRegistrationsContribution>(
        factory_name, std::move(definitions)));
}

BeanRegistrationsContribution::BeanRegistrationsContribution(
    std::string factory_name,
    std::vector<std::shared_ptr<const beans::BeanDefinition>> definitions)
    : factory_name_(std::move(factory_name)),
      definitions_(std::move(definitions)) {}

void BeanRegistrationsContribution::apply_to(GenerationContext& context) {
    const std::string class_name =
        context.class_names().generate(factory_name_, FEATURE_NAME);
    RegistrationCodeGenerator generator(class_name, factory_name_,
                                        context.extra_includes());
    for (const auto& definition : definitions_) {
        generator.add(definition);
    }

    context.files().add_source_file(generator.header_path(),
                                    generator.generate_header());
    context.files().add_source_file(generator.source_path(),
                                    generator.generate_source());
    context.factories().add(factory_name_,
                            ClassNameGenerator::qualify(class_name));
    SPRIG_LOG_INFO << "Generated " << ClassNameGenerator::qualify(class_name)
                   << " with " << generator.size() << " bean registrations";

    if (context.mark_once(InitializerCatalogContribution::ONCE_KEY)) {
        context.queue().enqueue(
            std::make_unique<InitializerCatalogContribution>());
    }
}

std::string BeanRegistrationsContribution::description() const {
    return "bean registrations for factory '" + factory_name_ + "' (" +
           std::to_string(definitions_.size()) + " beans)";
}

void InitializerCatalogContribution::apply_to(GenerationContext& context) {
    if (!context.queue().empty()) {
        SPRIG_LOG_TRACE << "Deferring initializer catalog behind "
                        << context.queue().size() << " pending contributions";
        context.queue().enqueue(
            std::make_unique<InitializerCatalogContribution>());
        return;
    }
    context.files().add_source_file(SOURCE_PATH,
                                    generate_source(context.factories()));
}

std::string InitializerCatalogContribution::generate_source(
    const GeneratedFactories& factories) {
    const std::string prefix =
        std::string(ClassNameGenerator::NAMESPACE) + "::";
    std::vector<std::string> identifiers = factories.all_initializers();

    std::ostringstream out;
    out << "// Generated by sprig AOT processing. Do not edit.\n"
        << "#include \"sprig/aot/generated_catalog.hpp\"\n";
    if (!identifiers.empty()) out << "\n";
    for (const auto& identifier : identifiers) {
        std::string class_name = identifier.rfind(prefix, 0) == 0
                                     ? identifier.substr(prefix.size())
                                     : identifier;
        out << "#include \""
            << RegistrationCodeGenerator::header_path_for(class_name)
            << "\"\n";
    }
    out << "\nnamespace " << ClassNameGenerator::NAMESPACE << " {\n\n"
        << "void register_initializers(sprig::aot::InitializerCatalog& "
           "catalog) {\n";
    if (identifiers.empty()) {
        out << "    static_cast<void>(catalog);\n";
    }
    for (const auto& identifier : identifiers) {
        out << "    catalog.add<" << identifier << ">("
            << RegistrationCodeGenerator::string_literal(identifier) << ");\n";
    }
    out << "}\n\n"
        << "}  // namespace " << ClassNameGenerator::NAMESPACE << "\n";
    return out.str();
}

}  // namespace sprig::aot
