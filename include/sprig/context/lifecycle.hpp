#pragma once

namespace sprig::context {

/**
 * @brief Beans exposing this are started after a refresh and stopped on close
 */
class Lifecycle {
public:
    virtual ~Lifecycle() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
};

}  // namespace sprig::context
