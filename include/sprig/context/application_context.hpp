#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sprig/aot/bootstrap.hpp"
#include "sprig/aot/registration_initializer.hpp"
#include "sprig/beans/bean_container.hpp"
#include "sprig/beans/registrar.hpp"
#include "sprig/context/lifecycle.hpp"

namespace sprig::context {

/**
 * @brief Owns a container and drives it through its lifecycle
 *
 * Registrars are applied in the order they were added, once. Each context
 * has its own container; nothing is shared between instances.
 */
class ApplicationContext {
public:
    enum class State { CREATED, ACTIVE, AOT_PREPARED, CLOSED };

    ApplicationContext();
    explicit ApplicationContext(beans::ContainerOptions options);
    ~ApplicationContext();

    ApplicationContext(const ApplicationContext&) = delete;
    ApplicationContext& operator=(const ApplicationContext&) = delete;

    ApplicationContext& add_registrar(std::shared_ptr<beans::Registrar> registrar);
    const std::vector<std::shared_ptr<beans::Registrar>>& registrars() const {
        return registrars_;
    }

    // Applies registrars, creates non-lazy singletons, starts Lifecycle beans
    void refresh();
    // Applies registrars only; no bean is instantiated
    void refresh_for_aot_processing();
    // Applies generated initializers, then refresh(); registrars added for
    // beans kept out of generation are applied after the initializers
    std::size_t bootstrap_from(const std::filesystem::path& index_path,
                               const aot::InitializerCatalog& catalog,
                               aot::FactoriesIndexCache& cache);
    // Stops Lifecycle beans and destroys singletons in reverse order
    void close();

    State state() const { return state_; }
    bool is_active() const { return state_ == State::ACTIVE; }

    beans::BeanContainer& container() { return container_; }
    const beans::BeanContainer& container() const { return container_; }

    template <typename T>
    std::shared_ptr<T> get_bean() const {
        return container_.get<T>();
    }

    template <typename T>
    std::shared_ptr<T> get_bean(const std::string& name) const {
        return container_.get<T>(name);
    }

private:
    void check_state(const char* operation) const;
    void apply_registrars();
    void start_lifecycle_beans();
    void stop_lifecycle_beans();

    beans::BeanContainer container_;
    std::vector<std::shared_ptr<beans::Registrar>> registrars_;
    std::vector<std::shared_ptr<Lifecycle>> started_;
    bool registrars_applied_ = false;
    State state_ = State::CREATED;
};

}  // namespace sprig::context
