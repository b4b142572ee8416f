// tests/context/test_application_context.cpp
#define BOOST_TEST_MODULE ApplicationContextTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sprig/aot/generated_factories.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"
#include "sprig/context/application_context.hpp"

namespace fs = boost::filesystem;
using namespace sprig::beans;
using sprig::context::ApplicationContext;
using sprig::context::Lifecycle;

namespace {

std::vector<std::string> g_events;

class Service : public Lifecycle {
public:
    void set_property(const std::string&, const ResolvedValue& value) {
        name_ = value.as<std::string>();
    }
    void start() override {
        running_ = true;
        g_events.push_back("start " + name_);
    }
    void stop() override {
        running_ = false;
        g_events.push_back("stop " + name_);
    }
    bool is_running() const override { return running_; }

private:
    std::string name_;
    bool running_ = false;
};

int broken_factory() { throw std::runtime_error("cannot build"); }

class LambdaRegistrar : public Registrar {
public:
    LambdaRegistrar(std::string name, std::function<void(BeanRegistry&)> apply)
        : name_(std::move(name)), apply_(std::move(apply)) {}

    std::string name() const override { return name_; }
    void apply(BeanRegistry& registry) override { apply_(registry); }

private:
    std::string name_;
    std::function<void(BeanRegistry&)> apply_;
};

std::shared_ptr<Registrar> services_registrar() {
    return std::make_shared<LambdaRegistrar>("services", [](BeanRegistry& r) {
        BeanDefinitionRegistrar<Service>::of("first")
            .exposes<Lifecycle>()
            .property("name", "first")
            .register_with(r);
        BeanDefinitionRegistrar<Service>::of("second")
            .exposes<Lifecycle>()
            .property("name", "second")
            .register_with(r);
    });
}

class ServiceRegistrations : public sprig::aot::RegistrationInitializer {
public:
    std::string name() const override { return "test::ServiceRegistrations"; }
    void initialize(BeanRegistry& registry) override {
        g_events.push_back("initializer");
        BeanDefinitionRegistrar<Service>::of("generated")
            .exposes<Lifecycle>()
            .property("name", "generated")
            .register_with(registry);
    }
};

struct ContextFixture {
    ContextFixture() { g_events.clear(); }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(ApplicationContextSuite, ContextFixture)

BOOST_AUTO_TEST_CASE(test_refresh_starts_and_close_stops_in_reverse) {
    {
        ApplicationContext context;
        context.add_registrar(services_registrar());
        context.refresh();
        BOOST_CHECK(context.is_active());
        BOOST_CHECK(context.get_bean<Service>("first")->is_running());
        context.close();
        BOOST_CHECK(context.state() == ApplicationContext::State::CLOSED);
        context.close();
    }
    std::vector<std::string> expected{"start first", "start second",
                                      "stop second", "stop first"};
    BOOST_CHECK_EQUAL_COLLECTIONS(g_events.begin(), g_events.end(),
                                  expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_destructor_closes) {
    {
        ApplicationContext context;
        context.add_registrar(services_registrar());
        context.refresh();
    }
    BOOST_REQUIRE_EQUAL(g_events.size(), 4u);
    BOOST_CHECK_EQUAL(g_events.back(), "stop first");
}

BOOST_AUTO_TEST_CASE(test_state_transitions_are_enforced) {
    ApplicationContext context;
    context.add_registrar(services_registrar());
    context.refresh();
    BOOST_CHECK_THROW(context.refresh(), std::logic_error);
    BOOST_CHECK_THROW(context.add_registrar(services_registrar()),
                      std::logic_error);
    BOOST_CHECK_THROW(context.add_registrar(nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_failed_refresh_stops_started_beans) {
    ApplicationContext context;
    context.add_registrar(services_registrar());
    context.add_registrar(
        std::make_shared<LambdaRegistrar>("broken", [](BeanRegistry& r) {
            BeanDefinitionRegistrar<int>::of("broken")
                .with_factory_method("broken_factory", &broken_factory)
                .register_with(r);
        }));

    BOOST_CHECK_THROW(context.refresh(), BeanCreationError);
    BOOST_CHECK(!context.is_active());
    BOOST_CHECK_EQUAL(context.container().singleton_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_aot_preparation_creates_nothing) {
    ApplicationContext context;
    context.add_registrar(services_registrar());
    context.refresh_for_aot_processing();
    BOOST_CHECK(context.state() == ApplicationContext::State::AOT_PREPARED);
    BOOST_CHECK_EQUAL(context.container().definition_count(), 2u);
    BOOST_CHECK_EQUAL(context.container().singleton_count(), 0u);
    BOOST_CHECK(g_events.empty());
}

BOOST_AUTO_TEST_CASE(test_bootstrap_applies_initializers_before_registrars) {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("sprig_ctx_%%%%-%%%%");
    fs::create_directories(temp_dir);
    const fs::path index = temp_dir / "factories.json";
    {
        sprig::aot::GeneratedFactories factories;
        factories.add("default", "test::ServiceRegistrations");
        std::ofstream out(index.string());
        out << factories.to_json();
    }

    sprig::aot::InitializerCatalog catalog;
    catalog.add<ServiceRegistrations>("test::ServiceRegistrations");
    sprig::aot::FactoriesIndexCache cache;

    {
        ApplicationContext context;
        context.add_registrar(std::make_shared<LambdaRegistrar>(
            "runtime", [](BeanRegistry& r) {
                g_events.push_back("registrar");
                BeanDefinitionRegistrar<Service>::of("runtime")
                    .exposes<Lifecycle>()
                    .property("name", "runtime")
                    .register_with(r);
            }));
        BOOST_CHECK_EQUAL(context.bootstrap_from(index.string(), catalog, cache),
                          1u);
        BOOST_CHECK(context.is_active());
        BOOST_CHECK(context.container().contains_definition("generated"));
        BOOST_CHECK(context.container().contains_definition("runtime"));
    }
    fs::remove_all(temp_dir);

    BOOST_REQUIRE_GE(g_events.size(), 4u);
    BOOST_CHECK_EQUAL(g_events[0], "initializer");
    BOOST_CHECK_EQUAL(g_events[1], "registrar");
    BOOST_CHECK_EQUAL(g_events[2], "start generated");
    BOOST_CHECK_EQUAL(g_events[3], "start runtime");
}

BOOST_AUTO_TEST_SUITE_END()
