#include "sprig/beans/construction_strategy.hpp"

#include <stdexcept>

namespace sprig::beans {

ArgumentSpec ArgumentSpec::literal(Literal value) {
    ArgumentSpec spec(Kind::LITERAL);
    spec.literal_ = std::move(value);
    return spec;
}

ArgumentSpec ArgumentSpec::reference(std::string bean_name) {
    if (bean_name.empty()) {
        throw std::invalid_argument("Argument reference name must not be empty");
    }
    ArgumentSpec spec(Kind::REFERENCE);
    spec.reference_ = std::move(bean_name);
    return spec;
}

std::string ArgumentSpec::to_string() const {
    switch (kind_) {
        case Kind::LITERAL:
            return literal_to_string(literal_);
        case Kind::REFERENCE:
            return "<ref " + reference_ + ">";
        case Kind::TYPE_REFERENCE:
            return "<bean of type " + type_->name() + ">";
    }
    return {};
}

const std::vector<ArgumentSpec>& DefaultConstructor::arguments() const {
    static const std::vector<ArgumentSpec> none;
    return none;
}

std::shared_ptr<void> DefaultConstructor::instantiate(
    const std::vector<ResolvedValue>& arguments) const {
    if (!arguments.empty()) {
        throw std::invalid_argument(
            "A default constructor takes no arguments");
    }
    return creator_();
}

FactoryMethod::FactoryMethod(std::string qualified_name, std::size_t arity,
                             std::vector<ArgumentSpec> arguments,
                             Invoker invoker)
    : qualified_name_(std::move(qualified_name)),
      arity_(arity),
      arguments_(std::move(arguments)),
      invoker_(std::move(invoker)) {}

std::shared_ptr<void> FactoryMethod::instantiate(
    const std::vector<ResolvedValue>& arguments) const {
    if (arguments.size() != arity_) {
        throw std::invalid_argument(
            description() + " expects " + std::to_string(arity_) +
            " arguments but got " + std::to_string(arguments.size()));
    }
    return invoker_(arguments);
}

std::string FactoryMethod::description() const {
    if (qualified_name_.empty()) return "instance supplier";
    return "factory method " + qualified_name_;
}

}  // namespace sprig::beans
