#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sprig/aot/registration_initializer.hpp"
#include "sprig/beans/registrar.hpp"
#include "sprig/cli/command.hpp"

namespace sprig::cli {

using RegistrarSupplier =
    std::function<std::vector<std::shared_ptr<beans::Registrar>>()>;
using CatalogFiller = std::function<void(aot::InitializerCatalog&)>;

// Reads --config, applies --log-level and initialises logging
void prepare_environment(const CommandContext& ctx);

/**
 * @brief `aot`: generates registration sources from the host's registrars
 */
class AotCommand : public Command {
public:
    explicit AotCommand(RegistrarSupplier registrars);

    int run(CommandContext& ctx) override;

private:
    RegistrarSupplier registrars_;
};

/**
 * @brief `beans`: bootstraps from a generated index and lists the beans
 *
 * Registrars given here cover beans that were kept out of generation.
 */
class BeansCommand : public Command {
public:
    explicit BeansCommand(CatalogFiller catalog,
                          RegistrarSupplier runtime_registrars = nullptr);

    int run(CommandContext& ctx) override;

private:
    CatalogFiller catalog_;
    RegistrarSupplier runtime_registrars_;
};

class RootCommand : public Command {
public:
    RootCommand(const std::string& name, const std::string& description);

    int run(CommandContext& ctx) override;
};

// Root command with `aot` and, when a catalog is given, `beans`
std::shared_ptr<RootCommand> create_root_command(
    const std::string& program_name, RegistrarSupplier registrars,
    CatalogFiller catalog = nullptr,
    RegistrarSupplier runtime_registrars = nullptr);

}  // namespace sprig::cli
