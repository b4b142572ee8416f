// tests/cli/test_command.cpp
#define BOOST_TEST_MODULE CommandTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sprig/aot/generated_factories.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"
#include "sprig/cli/commands.hpp"
#include "sprig/config/config.hpp"

namespace fs = boost::filesystem;
using namespace sprig::cli;
using namespace sprig::beans;

namespace cli_test {

struct Repository {};

}  // namespace cli_test

namespace {

class EchoCommand : public Command {
public:
    EchoCommand() : Command("echo", "Print flags and arguments") {
        add_string_flag("prefix", "p", "Line prefix", ">");
        add_bool_flag("loud", "Upper-case output");
        add_int_flag("repeat", "Repetitions", 1);
    }

    int run(CommandContext& ctx) override {
        for (int i = 0; i < ctx.get_int_flag("repeat"); ++i) {
            out() << ctx.get_flag("prefix") << " "
                  << (ctx.get_bool_flag("loud") ? "LOUD" : "quiet");
            for (const auto& arg : ctx.args()) out() << " " << arg;
            out() << "\n";
        }
        return ctx.is_user_provided("prefix") ? 7 : 0;
    }
};

class RepositoryRegistrar : public Registrar {
public:
    std::string name() const override { return "repositories"; }
    void apply(BeanRegistry& registry) override {
        BeanDefinitionRegistrar<cli_test::Repository>::of("repository")
            .declared_in("cli/repository.hpp")
            .register_with(registry);
    }
};

class RepositoryRegistrations : public sprig::aot::RegistrationInitializer {
public:
    std::string name() const override { return "test::RepositoryRegistrations"; }
    void initialize(BeanRegistry& registry) override {
        RepositoryRegistrar().apply(registry);
    }
};

std::vector<std::shared_ptr<Registrar>> repository_registrars() {
    return {std::make_shared<RepositoryRegistrar>()};
}

struct CliFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("sprig_cli_%%%%-%%%%");

    CliFixture() {
        fs::create_directories(temp_dir);
        sprig::config::ConfigManager::instance().reset();
    }
    ~CliFixture() {
        fs::remove_all(temp_dir);
        sprig::config::ConfigManager::instance().reset();
    }

    std::ostringstream output;
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(CommandSuite, CliFixture)

BOOST_AUTO_TEST_CASE(test_flags_defaults_and_arguments) {
    EchoCommand command;
    command.set_output(output);
    BOOST_CHECK_EQUAL(command.execute({"--loud", "--repeat", "2", "a", "b"}), 0);
    BOOST_CHECK_EQUAL(output.str(), "> LOUD a b\n> LOUD a b\n");
}

BOOST_AUTO_TEST_CASE(test_run_result_is_exit_code) {
    EchoCommand command;
    command.set_output(output);
    BOOST_CHECK_EQUAL(command.execute({"-p", "#"}), 7);
    BOOST_CHECK_EQUAL(output.str(), "# quiet\n");
}

BOOST_AUTO_TEST_CASE(test_unknown_option_fails) {
    EchoCommand command;
    command.set_output(output);
    BOOST_CHECK_EQUAL(command.execute({"--nope"}), 1);
    BOOST_CHECK(output.str().empty());
}

BOOST_AUTO_TEST_CASE(test_int_flag_accessor_rejects_text) {
    CommandContext ctx;
    ctx.set_default("repeat", "3");
    ctx.set_provided("name", "three");
    BOOST_CHECK_EQUAL(ctx.get_int_flag("repeat"), 3);
    BOOST_CHECK(!ctx.is_user_provided("repeat"));
    BOOST_CHECK(ctx.is_user_provided("name"));
    BOOST_CHECK_THROW(ctx.get_int_flag("name"), std::invalid_argument);
    BOOST_CHECK_EQUAL(ctx.get_flag("missing"), "");
}

BOOST_AUTO_TEST_CASE(test_unnamed_flag_is_rejected) {
    EchoCommand command;
    BOOST_CHECK_THROW(command.add_flag(FlagSpec{}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_subcommand_dispatch_and_help) {
    auto root = create_root_command("tool", &repository_registrars);
    root->add_command(std::make_shared<EchoCommand>());
    root->set_output(output);

    BOOST_CHECK_EQUAL(root->execute({"echo", "x"}), 0);
    BOOST_CHECK_EQUAL(output.str(), "> quiet x\n");

    output.str("");
    BOOST_CHECK_EQUAL(root->execute(std::vector<std::string>{}), 0);
    BOOST_CHECK(output.str().find("Available Commands:") != std::string::npos);
    BOOST_CHECK(output.str().find("aot") != std::string::npos);
    BOOST_CHECK(root->find_command("beans") == nullptr);

    output.str("");
    BOOST_CHECK_EQUAL(root->execute({"aot", "--help"}), 0);
    BOOST_CHECK(output.str().find("--output") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_aot_command_generates_output) {
    const fs::path out_dir = temp_dir / "generated";
    auto root = create_root_command("tool", &repository_registrars);
    root->set_output(output);

    BOOST_CHECK_EQUAL(root->execute({"aot", "--output", out_dir.string(),
                                     "--factory", "cli", "--log-level",
                                     "error"}),
                      0);
    BOOST_CHECK(fs::exists(out_dir / "sources/sprig_generated/Cli_BeanRegistrations.cpp"));
    BOOST_CHECK(output.str().find("cli -> sprig_generated::Cli_BeanRegistrations") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_aot_command_reads_config_file) {
    const fs::path out_dir = temp_dir / "from-config";
    const fs::path config = temp_dir / "app.yaml";
    {
        std::ofstream ofs(config.string());
        ofs << "log:\n  global_level: error\n"
            << "aot:\n  output_dir: " << out_dir.string() << "\n"
            << "  factory_name: configured\n";
    }
    auto root = create_root_command("tool", &repository_registrars);
    root->set_output(output);

    BOOST_CHECK_EQUAL(root->execute({"aot", "-c", config.string()}), 0);
    BOOST_CHECK(fs::exists(
        out_dir / "sources/sprig_generated/Configured_BeanRegistrations.hpp"));
}

BOOST_AUTO_TEST_CASE(test_aot_command_reports_failure) {
    auto root = create_root_command("tool", [] {
        std::vector<std::shared_ptr<Registrar>> registrars;
        registrars.push_back(std::make_shared<RepositoryRegistrar>());
        registrars.push_back(std::make_shared<RepositoryRegistrar>());
        return registrars;
    });
    root->set_output(output);
    // Duplicate names are fatal only in strict mode
    BOOST_CHECK_EQUAL(root->execute({"aot", "--output",
                                     (temp_dir / "strict").string(), "--strict",
                                     "--log-level", "fatal"}),
                      1);
    BOOST_CHECK(!fs::exists(temp_dir / "strict"));
}

BOOST_AUTO_TEST_CASE(test_beans_command_lists_bootstrapped_beans) {
    const fs::path index = temp_dir / "factories.json";
    {
        sprig::aot::GeneratedFactories factories;
        factories.add("default", "test::RepositoryRegistrations");
        std::ofstream ofs(index.string());
        ofs << factories.to_json();
    }

    auto root = create_root_command(
        "tool", &repository_registrars, [](sprig::aot::InitializerCatalog& catalog) {
            catalog.add<RepositoryRegistrations>("test::RepositoryRegistrations");
        });
    root->set_output(output);

    BOOST_CHECK_EQUAL(root->execute({"beans", "--index", index.string(),
                                     "--log-level", "error"}),
                      0);
    BOOST_CHECK(output.str().find("repository") != std::string::npos);
    BOOST_CHECK(output.str().find("cli_test::Repository") != std::string::npos);
    BOOST_CHECK(output.str().find("[singleton]") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
