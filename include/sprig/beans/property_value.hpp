#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace sprig::beans {

class BeanDefinition;

using Literal = std::variant<bool, std::int64_t, double, std::string>;

// Readable rendering used in logs and error messages
std::string literal_to_string(const Literal& literal);
std::string literal_type_name(const Literal& literal);

/**
 * @brief A value assigned to a named property of a bean definition
 *
 * Either a literal, an inner bean definition owned by the enclosing
 * definition, or a reference to another bean by name. Implicit constructors
 * from the literal types keep registrar call sites short.
 */
class PropertyValue {
public:
    enum class Kind { LITERAL, INNER_BEAN, REFERENCE };

    static PropertyValue literal(Literal value);
    static PropertyValue inner(std::shared_ptr<const BeanDefinition> definition);
    static PropertyValue reference(std::string bean_name);

    PropertyValue(Literal value);
    PropertyValue(bool value);
    PropertyValue(int value);
    PropertyValue(std::int64_t value);
    PropertyValue(double value);
    PropertyValue(const char* value);
    PropertyValue(std::string value);

    Kind kind() const { return kind_; }
    bool is_literal() const { return kind_ == Kind::LITERAL; }
    bool is_inner_bean() const { return kind_ == Kind::INNER_BEAN; }
    bool is_reference() const { return kind_ == Kind::REFERENCE; }

    // Accessors throw std::logic_error when called for the wrong kind
    const Literal& as_literal() const;
    const std::shared_ptr<const BeanDefinition>& inner_definition() const;
    const std::string& reference_name() const;

    std::string to_string() const;

private:
    PropertyValue() = default;

    Kind kind_ = Kind::LITERAL;
    Literal literal_;
    std::shared_ptr<const BeanDefinition> inner_;
    std::string reference_;
};

}  // namespace sprig::beans
