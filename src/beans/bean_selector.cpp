#include "sprig/beans/bean_selector.hpp"

#include <algorithm>
#include <stdexcept>

namespace sprig::beans {

BeanSelector BeanSelector::by_type(TypeDescriptor type) {
    return all().with_type(std::move(type));
}

BeanSelector BeanSelector::by_name(std::string name) {
    return all().with_name(std::move(name));
}

BeanSelector BeanSelector::with_type(TypeDescriptor type) const {
    BeanSelector copy = *this;
    copy.type_ = std::move(type);
    return copy;
}

BeanSelector BeanSelector::with_name(std::string name) const {
    BeanSelector copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

BeanSelector BeanSelector::with_qualifier(std::string qualifier) const {
    BeanSelector copy = *this;
    copy.qualifier_ = std::move(qualifier);
    return copy;
}

BeanSelector BeanSelector::with_filter(std::string description,
                                       Predicate predicate) const {
    if (description.empty()) {
        throw std::invalid_argument("A selector filter needs a description");
    }
    if (!predicate) {
        throw std::invalid_argument("Selector filter '" + description +
                                    "' has no predicate");
    }
    BeanSelector copy = *this;
    copy.filters_.push_back({std::move(description), std::move(predicate)});
    return copy;
}

bool BeanSelector::matches(const BeanDefinition& definition) const {
    if (name_ && definition.name() != *name_) return false;
    if (type_ && !definition.is_assignable_to(type_->index())) return false;
    if (qualifier_ && !definition.has_qualifier(*qualifier_)) return false;
    return std::all_of(
        filters_.begin(), filters_.end(),
        [&](const Filter& filter) { return filter.predicate(definition); });
}

std::string BeanSelector::description() const {
    std::string result = type_ ? "beans of type '" + type_->name() + "'"
                               : std::string("beans");
    if (name_) result += " named '" + *name_ + "'";
    if (qualifier_) result += " with qualifier '" + *qualifier_ + "'";
    for (std::size_t i = 0; i < filters_.size(); ++i) {
        result += (i == 0 && !qualifier_ ? " " : " and ") +
                  filters_[i].description;
    }
    return result;
}

bool BeanSelector::operator==(const BeanSelector& other) const {
    return type_ == other.type_ && name_ == other.name_ &&
           qualifier_ == other.qualifier_ &&
           std::equal(filters_.begin(), filters_.end(), other.filters_.begin(),
                      other.filters_.end(),
                      [](const Filter& a, const Filter& b) {
                          return a.description == b.description;
                      });
}

}  // namespace sprig::beans
