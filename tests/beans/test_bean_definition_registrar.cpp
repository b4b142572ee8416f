// tests/beans/test_bean_definition_registrar.cpp
#define BOOST_TEST_MODULE BeanDefinitionRegistrarTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include "sprig/beans/bean_container.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"
#include "sprig/beans/exceptions.hpp"

using namespace sprig::beans;

namespace {

struct Engine {
    virtual ~Engine() = default;
    virtual std::string kind() const = 0;
};

struct Diesel : Engine {
    std::string kind() const override { return "diesel"; }
};

struct Car {
    void set_property(const std::string& name, const ResolvedValue& value) {
        if (name == "engine") {
            engine = value.bean<Engine>();
        } else if (name == "doors") {
            doors = value.as<int>();
        } else {
            throw std::invalid_argument("unknown property " + name);
        }
    }

    std::shared_ptr<Engine> engine;
    int doors = 0;
};

// Not default constructible
struct Wheel {
    explicit Wheel(int size) : size(size) {}
    int size;
};

std::shared_ptr<Wheel> make_wheel(int size) {
    return std::make_shared<Wheel>(size);
}

}  // namespace

BOOST_AUTO_TEST_SUITE(RegistrarSuite)

BOOST_AUTO_TEST_CASE(test_default_constructor_is_inferred) {
    auto definition = BeanDefinitionRegistrar<Diesel>::of("engine")
                          .exposes<Engine>()
                          .to_definition();
    BOOST_CHECK_EQUAL(definition->name(), "engine");
    BOOST_REQUIRE(definition->construction_strategy());
    BOOST_CHECK(definition->construction_strategy()->kind() ==
                ConstructionStrategy::Kind::DEFAULT_CONSTRUCTOR);
    BOOST_CHECK(definition->is_assignable_to(typeid(Engine)));
}

BOOST_AUTO_TEST_CASE(test_missing_strategy_is_rejected) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Wheel>::of("wheel");
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
    BOOST_CHECK(!container.contains_definition("wheel"));
}

BOOST_AUTO_TEST_CASE(test_factory_arity_must_match_arguments) {
    BeanContainer container;
    auto registrar =
        BeanDefinitionRegistrar<Wheel>::of("wheel").with_factory_method(
            "make_wheel", &make_wheel, {});
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_properties_need_set_property) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Diesel>::of("engine").property(
        "power", 100);
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_empty_name_is_rejected) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Diesel>::of("");
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_inner_definition_cannot_register) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Diesel>::inner();
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
    BOOST_CHECK(registrar.to_definition()->is_inner());
}

BOOST_AUTO_TEST_CASE(test_customizers_run_in_order) {
    auto definition =
        BeanDefinitionRegistrar<Car>::of("car")
            .customize([](BeanDefinition& d) { d.set_description("first"); })
            .customize([](BeanDefinition& d) {
                d.set_description(d.description() + " second");
                d.set_primary(true);
            })
            .to_definition();
    BOOST_CHECK_EQUAL(definition->description(), "first second");
    BOOST_CHECK(definition->is_primary());
}

BOOST_AUTO_TEST_CASE(test_failing_customizer_is_wrapped) {
    auto registrar = BeanDefinitionRegistrar<Car>::of("car").customize(
        [](BeanDefinition&) { throw std::runtime_error("boom"); });
    BOOST_CHECK_THROW(registrar.to_definition(), InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_customizer_may_not_rename) {
    auto registrar = BeanDefinitionRegistrar<Car>::of("car").customize(
        [](BeanDefinition& d) { d.set_name("other"); });
    BOOST_CHECK_THROW(registrar.to_definition(), InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_double_registration_is_rejected) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Car>::of("car");
    registrar.register_with(container);
    BOOST_CHECK(registrar.is_registered());
    BOOST_CHECK_THROW(registrar.register_with(container),
                      InvalidDefinitionError);
}

BOOST_AUTO_TEST_CASE(test_changes_after_registration_are_ignored) {
    BeanContainer container;
    auto registrar = BeanDefinitionRegistrar<Car>::of("car");
    registrar.register_with(container);
    registrar.primary().property("doors", 5);
    BOOST_CHECK(!container.get_definition("car")->is_primary());
    BOOST_CHECK(container.get_definition("car")->property_values().empty());
}

BOOST_AUTO_TEST_CASE(test_inner_bean_and_literal_properties) {
    BeanContainer container;
    BeanDefinitionRegistrar<Car>::of("car")
        .property("engine",
                  BeanDefinitionRegistrar<Diesel>::inner().exposes<Engine>())
        .property("doors", 3)
        .register_with(container);

    auto car = container.get<Car>("car");
    BOOST_REQUIRE(car->engine);
    BOOST_CHECK_EQUAL(car->engine->kind(), "diesel");
    BOOST_CHECK_EQUAL(car->doors, 3);
    BOOST_CHECK_EQUAL(container.definition_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_factory_method_with_arguments) {
    BeanContainer container;
    BeanDefinitionRegistrar<Wheel>::of("wheel")
        .with_factory_method("make_wheel", &make_wheel,
                             {ArgumentSpec::literal(std::int64_t{17})})
        .register_with(container);
    BOOST_CHECK_EQUAL(container.get<Wheel>("wheel")->size, 17);
}

BOOST_AUTO_TEST_CASE(test_instance_supplier) {
    BeanContainer container;
    BeanDefinitionRegistrar<Wheel>::of("spare")
        .with_instance_supplier([] { return std::make_shared<Wheel>(15); })
        .register_with(container);

    auto definition = container.get_definition("spare");
    auto factory = std::dynamic_pointer_cast<const FactoryMethod>(
        definition->construction_strategy());
    BOOST_REQUIRE(factory);
    BOOST_CHECK(!factory->has_qualified_name());
    BOOST_CHECK_EQUAL(container.get<Wheel>("spare")->size, 15);
}

BOOST_AUTO_TEST_SUITE_END()
