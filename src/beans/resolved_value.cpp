#include "sprig/beans/resolved_value.hpp"

namespace sprig::beans {

ResolvedValue::ResolvedValue(Literal literal) : literal_(std::move(literal)) {}

ResolvedValue::ResolvedValue(std::shared_ptr<void> instance,
                             std::shared_ptr<const BeanDefinition> definition)
    : instance_(std::move(instance)), definition_(std::move(definition)) {
    if (!definition_) {
        throw std::invalid_argument(
            "A resolved bean value needs its definition");
    }
}

const Literal& ResolvedValue::literal() const {
    if (!is_literal()) {
        throw std::invalid_argument("Expected a literal but got a bean of type " +
                                    definition_->type().name());
    }
    return literal_;
}

std::string ResolvedValue::to_string() const {
    if (is_literal()) return literal_to_string(literal_);
    return "<bean " + definition_->type().name() + ">";
}

}  // namespace sprig::beans
