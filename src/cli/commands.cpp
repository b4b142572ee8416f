#include "sprig/cli/commands.hpp"

#include <iomanip>
#include <ostream>

#include "sprig/aot/aot_config.hpp"
#include "sprig/aot/aot_pipeline.hpp"
#include "sprig/aot/bootstrap.hpp"
#include "sprig/beans/container_config.hpp"
#include "sprig/config/config.hpp"
#include "sprig/context/application_context.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::cli {

namespace {

void add_common_flags(Command& command) {
    command.add_string_flag("config", "c",
                            "Configuration file (YAML, JSON or INI)");
    command.add_string_flag("log-level", "", "Override log.global_level");
}

beans::ContainerOptions container_options(const CommandContext& ctx) {
    auto& manager = config::ConfigManager::instance();
    auto options = manager.ensure_configuration_properties<beans::ContainerConfig>()
                       ->to_options();
    if (ctx.get_bool_flag("strict")) {
        options.registration_policy = beans::RegistrationPolicy::STRICT;
    }
    return options;
}

}  // namespace

void prepare_environment(const CommandContext& ctx) {
    auto& manager = config::ConfigManager::instance();
    auto log_config = manager.ensure_configuration_properties<log::LogConfig>();
    manager.ensure_configuration_properties<beans::ContainerConfig>();
    manager.ensure_configuration_properties<aot::AotConfig>();

    const std::string config_file = ctx.get_flag("config");
    if (!config_file.empty()) {
        manager.load_config(config_file, config::format_from_path(config_file));
    }

    log::LogConfig effective = *log_config;
    if (ctx.is_user_provided("log-level")) {
        effective.global_level =
            log::LogConfig::level_from_string(ctx.get_flag("log-level"));
    }
    log::Logger::init(effective);
}

AotCommand::AotCommand(RegistrarSupplier registrars)
    : Command("aot", "Generate bean registration sources"),
      registrars_(std::move(registrars)) {
    add_common_flags(*this);
    add_string_flag("output", "o",
                    "Output directory (overrides aot.output_dir)");
    add_string_flag("factory", "f",
                    "Bean factory name (overrides aot.factory_name)");
    add_bool_flag("strict", "Reject duplicate bean names");
    set_example("  app aot --config config/app.yaml --output build/generated");
}

int AotCommand::run(CommandContext& ctx) {
    prepare_environment(ctx);

    auto& manager = config::ConfigManager::instance();
    aot::AotOptions options =
        manager.ensure_configuration_properties<aot::AotConfig>()->to_options();
    options.container = container_options(ctx);
    if (ctx.is_user_provided("output")) {
        options.output_dir = ctx.get_flag("output");
    }
    if (ctx.is_user_provided("factory")) {
        options.factory_name = ctx.get_flag("factory");
    }

    aot::AotPipeline pipeline(options);
    auto result = pipeline.run(registrars_ ? registrars_()
                                           : std::vector<std::shared_ptr<beans::Registrar>>{});

    out() << "Generated " << result.generated_files.size() << " files in "
          << options.output_dir.string() << std::endl;
    for (const auto& entry : result.factories.entries()) {
        for (const auto& initializer : entry.initializers) {
            out() << "  " << entry.key << " -> " << initializer << std::endl;
        }
    }
    return 0;
}

BeansCommand::BeansCommand(CatalogFiller catalog,
                           RegistrarSupplier runtime_registrars)
    : Command("beans", "Bootstrap from generated registrations and list beans"),
      catalog_(std::move(catalog)),
      runtime_registrars_(std::move(runtime_registrars)) {
    add_common_flags(*this);
    add_string_flag("index", "i", "Generated factories index",
                    "generated/resources/META-INF/sprig/factories.json");
    add_bool_flag("strict", "Reject duplicate bean names");
}

int BeansCommand::run(CommandContext& ctx) {
    prepare_environment(ctx);

    aot::InitializerCatalog catalog;
    catalog_(catalog);
    aot::FactoriesIndexCache cache;

    context::ApplicationContext app(container_options(ctx));
    if (runtime_registrars_) {
        for (const auto& registrar : runtime_registrars_()) {
            app.add_registrar(registrar);
        }
    }
    app.bootstrap_from(ctx.get_flag("index"), catalog, cache);

    const auto& container = app.container();
    for (const auto& name : container.definition_names()) {
        auto definition = container.get_definition(name);
        out() << std::left << std::setw(24) << name << " "
              << definition->type().name();
        if (container.contains_singleton(name)) out() << " [singleton]";
        if (definition->is_lazy_init()) out() << " [lazy]";
        out() << std::endl;
    }
    app.close();
    return 0;
}

RootCommand::RootCommand(const std::string& name,
                         const std::string& description)
    : Command(name, description) {}

int RootCommand::run(CommandContext&) {
    print_help();
    return 0;
}

std::shared_ptr<RootCommand> create_root_command(
    const std::string& program_name, RegistrarSupplier registrars,
    CatalogFiller catalog, RegistrarSupplier runtime_registrars) {
    auto root = std::make_shared<RootCommand>(
        program_name, "Bean container with ahead-of-time registration");
    root->add_command(std::make_shared<AotCommand>(std::move(registrars)));
    if (catalog) {
        root->add_command(std::make_shared<BeansCommand>(
            std::move(catalog), std::move(runtime_registrars)));
    }
    return root;
}

}  // namespace sprig::cli
