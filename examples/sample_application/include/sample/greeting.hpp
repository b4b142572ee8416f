#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "sprig/beans/exclude_filter.hpp"
#include "sprig/beans/resolved_value.hpp"
#include "sprig/context/lifecycle.hpp"

namespace sample {

class MessageSource {
public:
    void set_property(const std::string& name,
                      const sprig::beans::ResolvedValue& value);

    const std::string& greeting() const { return greeting_; }

private:
    std::string greeting_ = "Hello";
};

class Counter {
public:
    void set_property(const std::string& name,
                      const sprig::beans::ResolvedValue& value);

    int next() { return value_++; }

private:
    int value_ = 0;
};

class Greeter {
public:
    virtual ~Greeter() = default;
    virtual std::string greet(const std::string& who) = 0;
};

class ConsoleGreeter : public Greeter {
public:
    ConsoleGreeter(std::shared_ptr<MessageSource> source,
                   std::string punctuation);

    void set_property(const std::string& name,
                      const sprig::beans::ResolvedValue& value);

    std::string greet(const std::string& who) override;

private:
    std::shared_ptr<MessageSource> source_;
    std::string punctuation_;
    std::string prefix_;
    std::shared_ptr<Counter> counter_;
};

std::shared_ptr<ConsoleGreeter> make_greeter(
    std::shared_ptr<MessageSource> source, std::string punctuation);

// Hides beans qualified "experimental" from code generation
class ExperimentalBeanFilter : public sprig::beans::DefinitionExcludeFilter {
public:
    bool is_excluded(
        const sprig::beans::BeanDefinition& definition) const override;
};

// Runtime-only bean: created by an instance supplier
class AuditLog : public sprig::context::Lifecycle {
public:
    explicit AuditLog(std::ostream& out) : out_(out) {}

    void start() override;
    void stop() override;
    bool is_running() const override { return running_; }

private:
    std::ostream& out_;
    bool running_ = false;
};

}  // namespace sample
