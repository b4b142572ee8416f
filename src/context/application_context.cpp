#include "sprig/context/application_context.hpp"

#include <stdexcept>

#include "sprig/log/logger.hpp"

namespace sprig::context {

ApplicationContext::ApplicationContext()
    : ApplicationContext(beans::ContainerOptions{}) {}

ApplicationContext::ApplicationContext(beans::ContainerOptions options)
    : container_(options) {}

ApplicationContext::~ApplicationContext() {
    try {
        close();
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Error while closing application context: "
                        << e.what();
    }
}

ApplicationContext& ApplicationContext::add_registrar(
    std::shared_ptr<beans::Registrar> registrar) {
    if (!registrar) {
        throw std::invalid_argument("Registrar must not be null");
    }
    if (registrars_applied_) {
        throw std::logic_error("Cannot add registrar '" + registrar->name() +
                               "' after the context was refreshed");
    }
    registrars_.push_back(std::move(registrar));
    return *this;
}

void ApplicationContext::check_state(const char* operation) const {
    if (state_ != State::CREATED) {
        throw std::logic_error(std::string("Cannot ") + operation +
                               ": application context was already refreshed "
                               "or closed");
    }
}

void ApplicationContext::apply_registrars() {
    if (registrars_applied_) return;
    registrars_applied_ = true;
    for (const auto& registrar : registrars_) {
        try {
            SPRIG_LOG_DEBUG << "Applying registrar: " << registrar->name();
            registrar->apply(container_);
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Registrar " << registrar->name()
                            << " failed: " << e.what();
            throw;
        }
    }
}

void ApplicationContext::refresh() {
    check_state("refresh");
    try {
        apply_registrars();
        container_.refresh();
        start_lifecycle_beans();
        state_ = State::ACTIVE;
        SPRIG_LOG_INFO << "Application context refreshed with "
                       << container_.definition_count() << " beans";
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Application context refresh failed: " << e.what();
        stop_lifecycle_beans();
        container_.destroy_singletons();
        throw;
    }
}

void ApplicationContext::refresh_for_aot_processing() {
    check_state("prepare for AOT processing");
    apply_registrars();
    container_.refresh_for_aot_processing();
    state_ = State::AOT_PREPARED;
}

std::size_t ApplicationContext::bootstrap_from(
    const std::filesystem::path& index_path,
    const aot::InitializerCatalog& catalog, aot::FactoriesIndexCache& cache) {
    check_state("bootstrap");
    std::size_t applied = aot::bootstrap(container_, index_path, catalog, cache);
    refresh();
    return applied;
}

void ApplicationContext::start_lifecycle_beans() {
    for (const auto& bean : container_.select<Lifecycle>()) {
        if (bean->is_running()) continue;
        bean->start();
        started_.push_back(bean);
    }
}

void ApplicationContext::stop_lifecycle_beans() {
    while (!started_.empty()) {
        auto bean = std::move(started_.back());
        started_.pop_back();
        try {
            if (bean->is_running()) bean->stop();
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Failed to stop lifecycle bean: " << e.what();
        }
    }
}

void ApplicationContext::close() {
    if (state_ == State::CLOSED) return;
    SPRIG_LOG_DEBUG << "Closing application context";
    stop_lifecycle_beans();
    container_.destroy_singletons();
    state_ = State::CLOSED;
}

}  // namespace sprig::context
