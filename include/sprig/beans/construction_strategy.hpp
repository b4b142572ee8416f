#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sprig/beans/property_value.hpp"
#include "sprig/beans/resolved_value.hpp"
#include "sprig/beans/type_descriptor.hpp"

namespace sprig::beans {

/**
 * @brief How one factory method argument is obtained
 */
class ArgumentSpec {
public:
    enum class Kind { LITERAL, REFERENCE, TYPE_REFERENCE };

    static ArgumentSpec literal(Literal value);
    static ArgumentSpec reference(std::string bean_name);
    template <typename T>
    static ArgumentSpec of_type() {
        ArgumentSpec spec(Kind::TYPE_REFERENCE);
        spec.type_ = TypeDescriptor::of<T>();
        return spec;
    }

    Kind kind() const { return kind_; }
    const Literal& as_literal() const { return literal_; }
    const std::string& reference_name() const { return reference_; }
    const TypeDescriptor& reference_type() const { return *type_; }

    std::string to_string() const;

private:
    explicit ArgumentSpec(Kind kind) : kind_(kind) {}

    Kind kind_;
    Literal literal_;
    std::string reference_;
    std::optional<TypeDescriptor> type_;
};

/**
 * @brief Capability that turns resolved arguments into a new instance
 */
class ConstructionStrategy {
public:
    enum class Kind { DEFAULT_CONSTRUCTOR, FACTORY_METHOD };

    virtual ~ConstructionStrategy() = default;

    virtual Kind kind() const = 0;
    virtual const std::vector<ArgumentSpec>& arguments() const = 0;
    virtual std::shared_ptr<void> instantiate(
        const std::vector<ResolvedValue>& arguments) const = 0;
    virtual std::string description() const = 0;
};

class DefaultConstructor : public ConstructionStrategy {
public:
    using Creator = std::function<std::shared_ptr<void>()>;

    explicit DefaultConstructor(Creator creator)
        : creator_(std::move(creator)) {}

    template <typename T>
    static std::shared_ptr<const DefaultConstructor> of() {
        return std::make_shared<const DefaultConstructor>(
            []() -> std::shared_ptr<void> { return std::make_shared<T>(); });
    }

    Kind kind() const override { return Kind::DEFAULT_CONSTRUCTOR; }
    const std::vector<ArgumentSpec>& arguments() const override;
    std::shared_ptr<void> instantiate(
        const std::vector<ResolvedValue>& arguments) const override;
    std::string description() const override { return "default constructor"; }

private:
    Creator creator_;
};

/**
 * @brief A free function (or static member) producing the bean
 *
 * The qualified name is what generated code spells to reach the function
 * again; an empty name marks an instance supplier that can only be used at
 * runtime.
 */
class FactoryMethod : public ConstructionStrategy {
public:
    using Invoker = std::function<std::shared_ptr<void>(
        const std::vector<ResolvedValue>& arguments)>;

    FactoryMethod(std::string qualified_name, std::size_t arity,
                  std::vector<ArgumentSpec> arguments, Invoker invoker);

    Kind kind() const override { return Kind::FACTORY_METHOD; }
    const std::vector<ArgumentSpec>& arguments() const override {
        return arguments_;
    }
    std::shared_ptr<void> instantiate(
        const std::vector<ResolvedValue>& arguments) const override;
    std::string description() const override;

    const std::string& qualified_name() const { return qualified_name_; }
    bool has_qualified_name() const { return !qualified_name_.empty(); }
    std::size_t arity() const { return arity_; }

private:
    std::string qualified_name_;
    std::size_t arity_;
    std::vector<ArgumentSpec> arguments_;
    Invoker invoker_;
};

namespace detail {

template <typename T>
struct shared_ptr_traits : std::false_type {};

template <typename T>
struct shared_ptr_traits<std::shared_ptr<T>> : std::true_type {
    using element_type = T;
};

template <typename P>
std::decay_t<P> convert_argument(const ResolvedValue& value) {
    using Arg = std::decay_t<P>;
    if constexpr (shared_ptr_traits<Arg>::value) {
        return value.bean<typename shared_ptr_traits<Arg>::element_type>();
    } else {
        return value.as<Arg>();
    }
}

// Wraps whatever the factory returns into a pointer to the declared type T
template <typename T, typename R>
std::shared_ptr<void> to_declared_instance(R&& result) {
    using Result = std::decay_t<R>;
    if constexpr (shared_ptr_traits<Result>::value) {
        std::shared_ptr<T> instance = std::forward<R>(result);
        if (!instance) {
            throw std::runtime_error("factory method returned a null pointer");
        }
        return instance;
    } else {
        static_assert(std::is_constructible_v<T, Result>,
                      "Factory result must be a shared_ptr to the bean type "
                      "or a value the bean type can be built from");
        return std::make_shared<T>(std::forward<R>(result));
    }
}

template <typename T, typename R, typename... Params, std::size_t... I>
std::shared_ptr<void> invoke_factory(R (*factory)(Params...),
                                     const std::vector<ResolvedValue>& arguments,
                                     std::index_sequence<I...>) {
    return to_declared_instance<T>(
        factory(convert_argument<Params>(arguments[I])...));
}

}  // namespace detail

template <typename T, typename R, typename... Params>
std::shared_ptr<const FactoryMethod> make_factory_method(
    std::string qualified_name, R (*factory)(Params...),
    std::vector<ArgumentSpec> arguments) {
    FactoryMethod::Invoker invoker =
        [factory](const std::vector<ResolvedValue>& resolved) {
            return detail::invoke_factory<T>(
                factory, resolved, std::index_sequence_for<Params...>{});
        };
    return std::make_shared<const FactoryMethod>(
        std::move(qualified_name), sizeof...(Params), std::move(arguments),
        std::move(invoker));
}

}  // namespace sprig::beans
