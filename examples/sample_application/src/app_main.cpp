// Runtime application: starts from the generated registrations only
#include <iostream>
#include <memory>

#include "sample/greeting.hpp"
#include "sample/sample_registrar.hpp"
#include "sprig/aot/bootstrap.hpp"
#include "sprig/aot/generated_catalog.hpp"
#include "sprig/cli/commands.hpp"
#include "sprig/context/application_context.hpp"
#include "sprig/log/logger.hpp"

namespace {

class GreetCommand : public sprig::cli::Command {
public:
    GreetCommand() : Command("greet", "Greet someone using the generated beans") {
        add_string_flag("config", "c", "Configuration file");
        add_string_flag("log-level", "", "Override log.global_level");
        add_string_flag("index", "i", "Generated factories index",
                        "generated/resources/META-INF/sprig/factories.json");
        add_string_flag("name", "n", "Who to greet", "world");
        add_int_flag("times", "How many greetings to print", 1);
    }

    int run(sprig::cli::CommandContext& ctx) override {
        sprig::cli::prepare_environment(ctx);

        sprig::aot::InitializerCatalog catalog;
        sprig_generated::register_initializers(catalog);
        sprig::aot::FactoriesIndexCache cache;

        sprig::context::ApplicationContext app;
        for (const auto& registrar : sample::runtime_registrars()) {
            app.add_registrar(registrar);
        }
        app.bootstrap_from(ctx.get_flag("index"), catalog, cache);

        auto greeter = app.get_bean<sample::Greeter>();
        for (int i = 0; i < ctx.get_int_flag("times"); ++i) {
            out() << greeter->greet(ctx.get_flag("name")) << std::endl;
        }
        app.close();
        return 0;
    }
};

}  // namespace

int main(int argc, char* argv[]) {
    auto root = sprig::cli::create_root_command(
        "sample_app", &sample::all_registrars,
        &sprig_generated::register_initializers, &sample::runtime_registrars);
    root->add_command(std::make_shared<GreetCommand>());
    return root->execute(argc, argv);
}
