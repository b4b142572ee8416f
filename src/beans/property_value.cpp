#include "sprig/beans/property_value.hpp"

#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "sprig/beans/bean_definition.hpp"

namespace sprig::beans {

std::string literal_to_string(const Literal& literal) {
    return std::visit(
        [](const auto& value) -> std::string {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_same_v<V, std::string>) {
                return value;
            } else {
                std::ostringstream out;
                out << value;
                return out.str();
            }
        },
        literal);
}

std::string literal_type_name(const Literal& literal) {
    switch (literal.index()) {
        case 0:
            return "boolean";
        case 1:
            return "integer";
        case 2:
            return "floating point";
        default:
            return "string";
    }
}

PropertyValue PropertyValue::literal(Literal value) {
    PropertyValue result;
    result.kind_ = Kind::LITERAL;
    result.literal_ = std::move(value);
    return result;
}

PropertyValue PropertyValue::inner(
    std::shared_ptr<const BeanDefinition> definition) {
    if (!definition) {
        throw std::invalid_argument("Inner bean definition must not be null");
    }
    PropertyValue result;
    result.kind_ = Kind::INNER_BEAN;
    result.inner_ = std::move(definition);
    return result;
}

PropertyValue PropertyValue::reference(std::string bean_name) {
    if (bean_name.empty()) {
        throw std::invalid_argument("Bean reference name must not be empty");
    }
    PropertyValue result;
    result.kind_ = Kind::REFERENCE;
    result.reference_ = std::move(bean_name);
    return result;
}

PropertyValue::PropertyValue(Literal value)
    : kind_(Kind::LITERAL), literal_(std::move(value)) {}
PropertyValue::PropertyValue(bool value) : literal_(value) {}
PropertyValue::PropertyValue(int value)
    : literal_(static_cast<std::int64_t>(value)) {}
PropertyValue::PropertyValue(std::int64_t value) : literal_(value) {}
PropertyValue::PropertyValue(double value) : literal_(value) {}
PropertyValue::PropertyValue(const char* value)
    : literal_(std::string(value)) {}
PropertyValue::PropertyValue(std::string value) : literal_(std::move(value)) {}

const Literal& PropertyValue::as_literal() const {
    if (kind_ != Kind::LITERAL) {
        throw std::logic_error("Property value is not a literal");
    }
    return literal_;
}

const std::shared_ptr<const BeanDefinition>& PropertyValue::inner_definition()
    const {
    if (kind_ != Kind::INNER_BEAN) {
        throw std::logic_error("Property value is not an inner bean");
    }
    return inner_;
}

const std::string& PropertyValue::reference_name() const {
    if (kind_ != Kind::REFERENCE) {
        throw std::logic_error("Property value is not a bean reference");
    }
    return reference_;
}

std::string PropertyValue::to_string() const {
    switch (kind_) {
        case Kind::LITERAL:
            return literal_to_string(literal_);
        case Kind::INNER_BEAN:
            return "<inner " + inner_->type().name() + ">";
        case Kind::REFERENCE:
            return "<ref " + reference_ + ">";
    }
    return {};
}

}  // namespace sprig::beans
