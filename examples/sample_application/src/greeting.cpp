#include "sample/greeting.hpp"

#include <ostream>
#include <stdexcept>

namespace sample {

void MessageSource::set_property(const std::string& name,
                                 const sprig::beans::ResolvedValue& value) {
    if (name != "greeting") {
        throw std::invalid_argument("unknown property " + name);
    }
    greeting_ = value.as<std::string>();
}

void Counter::set_property(const std::string& name,
                           const sprig::beans::ResolvedValue& value) {
    if (name != "start") {
        throw std::invalid_argument("unknown property " + name);
    }
    value_ = value.as<int>();
}

ConsoleGreeter::ConsoleGreeter(std::shared_ptr<MessageSource> source,
                               std::string punctuation)
    : source_(std::move(source)), punctuation_(std::move(punctuation)) {}

void ConsoleGreeter::set_property(const std::string& name,
                                  const sprig::beans::ResolvedValue& value) {
    if (name == "prefix") {
        prefix_ = value.as<std::string>();
    } else if (name == "counter") {
        counter_ = value.bean<Counter>();
    } else {
        throw std::invalid_argument("unknown property " + name);
    }
}

std::string ConsoleGreeter::greet(const std::string& who) {
    std::string message = prefix_ + source_->greeting() + ", " + who +
                          punctuation_;
    if (counter_) message += " #" + std::to_string(counter_->next());
    return message;
}

std::shared_ptr<ConsoleGreeter> make_greeter(
    std::shared_ptr<MessageSource> source, std::string punctuation) {
    return std::make_shared<ConsoleGreeter>(std::move(source),
                                            std::move(punctuation));
}

bool ExperimentalBeanFilter::is_excluded(
    const sprig::beans::BeanDefinition& definition) const {
    return definition.has_qualifier("experimental");
}

void AuditLog::start() {
    running_ = true;
    out_ << "audit log started" << std::endl;
}

void AuditLog::stop() {
    running_ = false;
    out_ << "audit log stopped" << std::endl;
}

}  // namespace sample
