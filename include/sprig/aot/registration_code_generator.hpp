#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sprig/beans/bean_definition.hpp"
#include "sprig/beans/construction_strategy.hpp"

namespace sprig::aot {

/**
 * @brief Writes the C++ source of one generated registrations class
 *
 * Each definition becomes a BeanDefinitionRegistrar chain inside
 * initialize(); inner definitions are nested as registrar expressions.
 */
class RegistrationCodeGenerator {
public:
    RegistrationCodeGenerator(std::string class_name, std::string factory_name,
                              std::vector<std::string> extra_includes = {});

    // Throws AotProcessingError when the definition cannot be expressed
    void add(std::shared_ptr<const beans::BeanDefinition> definition);
    std::size_t size() const { return definitions_.size(); }

    const std::string& class_name() const { return class_name_; }
    std::string header_path() const;
    std::string source_path() const;

    std::string generate_header() const;
    std::string generate_source() const;

    // Relative header path of a generated class, e.g.
    // sprig_generated/Default_BeanRegistrations.hpp
    static std::string header_path_for(const std::string& class_name);
    static std::string string_literal(const std::string& value);
    static std::string literal_expression(const beans::Literal& literal);
    static std::string argument_expression(const beans::ArgumentSpec& argument);
    static std::string registrar_expression(
        const beans::BeanDefinition& definition, int indent);

private:
    static void check_expressible(const beans::BeanDefinition& definition,
                                  const std::string& owner);
    void collect_includes(const beans::BeanDefinition& definition,
                          std::vector<std::string>& includes) const;

    std::string class_name_;
    std::string factory_name_;
    std::vector<std::string> extra_includes_;
    std::vector<std::shared_ptr<const beans::BeanDefinition>> definitions_;
};

}  // namespace sprig::aot
