// tests/beans/test_bean_selection.cpp
#define BOOST_TEST_MODULE BeanSelectionTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sprig/beans/bean_container.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"
#include "sprig/beans/exceptions.hpp"

using namespace sprig::beans;

namespace {

struct Codec {
    virtual ~Codec() = default;
    virtual std::string id() const = 0;
};

struct JsonCodec : Codec {
    std::string id() const override { return "json"; }
};

struct YamlCodec : Codec {
    std::string id() const override { return "yaml"; }
};

struct SelectionFixture {
    SelectionFixture() {
        BeanDefinitionRegistrar<JsonCodec>::of("json")
            .exposes<Codec>()
            .qualifier("text")
            .register_with(container);
        BeanDefinitionRegistrar<YamlCodec>::of("yaml")
            .exposes<Codec>()
            .qualifier("text")
            .qualifier("config")
            .register_with(container);
    }

    BeanContainer container;
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(BeanSelectionSuite, SelectionFixture)

BOOST_AUTO_TEST_CASE(test_empty_selection_never_throws) {
    BOOST_CHECK_NO_THROW(container.select<std::string>());
    auto selection = container.select<std::string>();
    BOOST_CHECK(selection.empty());
    BOOST_CHECK_EQUAL(selection.count(), 0u);
    BOOST_CHECK(selection.to_vector().empty());
    BOOST_CHECK(selection.to_optional() == nullptr);

    try {
        selection.to_single();
        BOOST_FAIL("expected a non-unique error");
    } catch (const NonUniqueBeanError& e) {
        BOOST_CHECK_EQUAL(e.match_count(), 0u);
    }
}

BOOST_AUTO_TEST_CASE(test_many_selection_to_single_reports_count) {
    auto selection = container.select<Codec>();
    BOOST_CHECK_EQUAL(selection.count(), 2u);
    try {
        selection.to_single();
        BOOST_FAIL("expected a non-unique error");
    } catch (const NonUniqueBeanError& e) {
        BOOST_CHECK_EQUAL(e.match_count(), 2u);
        BOOST_CHECK_EQUAL(e.candidates()[0], "json");
    }
    BOOST_CHECK_THROW(selection.to_optional(), NonUniqueBeanError);
}

BOOST_AUTO_TEST_CASE(test_iteration_in_registration_order) {
    std::vector<std::string> ids;
    for (const auto& codec : container.select<Codec>()) {
        ids.push_back(codec->id());
    }
    std::vector<std::string> expected{"json", "yaml"};
    BOOST_CHECK_EQUAL_COLLECTIONS(ids.begin(), ids.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(test_qualifier_narrows_selection) {
    auto selector = BeanSelector::by_type<Codec>().with_qualifier("config");
    auto selection = container.select<Codec>(selector);
    BOOST_REQUIRE_EQUAL(selection.count(), 1u);
    BOOST_CHECK_EQUAL(selection.to_single()->id(), "yaml");
    BOOST_CHECK_EQUAL(container.get<Codec>(selector)->id(), "yaml");
}

BOOST_AUTO_TEST_CASE(test_untyped_selection) {
    auto selection = container.select(BeanSelector::all());
    BOOST_CHECK_EQUAL(selection.count(), 2u);
    BOOST_CHECK_EQUAL(selection.to_vector().size(), 2u);

    auto by_name = container.select(BeanSelector::by_name("json"));
    BOOST_CHECK(by_name.to_single());
}

BOOST_AUTO_TEST_CASE(test_selection_resolves_lazily) {
    auto selection = container.select<Codec>();
    BOOST_CHECK_EQUAL(container.singleton_count(), 0u);
    selection.to_vector();
    BOOST_CHECK_EQUAL(container.singleton_count(), 2u);
}

BOOST_AUTO_TEST_CASE(test_selector_description_and_equality) {
    auto selector =
        BeanSelector::by_type<int>().with_name("n").with_qualifier("q");
    BOOST_CHECK_EQUAL(selector.description(),
                      "beans of type 'int' named 'n' with qualifier 'q'");
    BOOST_CHECK(selector == BeanSelector::by_name("n")
                                .with_qualifier("q")
                                .with_type<int>());
    BOOST_CHECK(selector != BeanSelector::by_type<int>());
}

BOOST_AUTO_TEST_CASE(test_filter_narrows_selection) {
    BeanDefinitionRegistrar<JsonCodec>::of("lazyJson")
        .exposes<Codec>()
        .lazy()
        .register_with(container);

    auto lazy = BeanSelector::by_type<Codec>().with_filter(
        "that are lazy",
        [](const BeanDefinition& definition) {
            return definition.is_lazy_init();
        });
    auto selection = container.select<Codec>(lazy);
    BOOST_REQUIRE_EQUAL(selection.count(), 1u);
    BOOST_CHECK_EQUAL(selection.names()[0], "lazyJson");

    // Filters and qualifiers must all hold
    auto none = lazy.with_qualifier("text");
    BOOST_CHECK(container.select<Codec>(none).empty());
    auto named_y = BeanSelector::by_type<Codec>()
                       .with_filter("named like 'y*'",
                                    [](const BeanDefinition& definition) {
                                        return definition.name().front() == 'y';
                                    })
                       .with_filter("with qualifier 'config'",
                                    [](const BeanDefinition& definition) {
                                        return definition.has_qualifier("config");
                                    });
    BOOST_CHECK_EQUAL(container.get<Codec>(named_y)->id(), "yaml");
}

BOOST_AUTO_TEST_CASE(test_filter_description_and_equality) {
    auto always = [](const BeanDefinition&) { return true; };
    auto never = [](const BeanDefinition&) { return false; };

    auto selector = BeanSelector::by_type<int>().with_filter("that are lazy",
                                                             always);
    BOOST_CHECK_EQUAL(selector.description(),
                      "beans of type 'int' that are lazy");
    BOOST_CHECK_EQUAL(
        selector.with_qualifier("q").with_filter("from tests", always)
            .description(),
        "beans of type 'int' with qualifier 'q' and that are lazy and from tests");

    // Filters compare by description, in order
    BOOST_CHECK(selector ==
                BeanSelector::by_type<int>().with_filter("that are lazy", never));
    BOOST_CHECK(selector != BeanSelector::by_type<int>());
    BOOST_CHECK(selector.with_filter("a", always).with_filter("b", always) !=
                selector.with_filter("b", always).with_filter("a", always));

    try {
        container.get<Codec>(BeanSelector::by_type<Codec>().with_filter(
            "that never match", never));
        BOOST_FAIL("expected a missing bean error");
    } catch (const NoSuchBeanError& e) {
        BOOST_CHECK(std::string(e.what()).find("that never match") !=
                    std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_filter_requires_description_and_predicate) {
    BOOST_CHECK_THROW(BeanSelector::all().with_filter(
                          "", [](const BeanDefinition&) { return true; }),
                      std::invalid_argument);
    BOOST_CHECK_THROW(
        BeanSelector::all().with_filter("broken", BeanSelector::Predicate()),
        std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
