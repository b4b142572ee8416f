#pragma once

#include <boost/type_index.hpp>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>

namespace sprig::beans {

/**
 * @brief Runtime identity of a C++ type together with its readable spelling
 *
 * The spelling comes from Boost.TypeIndex and is fully qualified, so the AOT
 * code generator can emit it verbatim.
 */
class TypeDescriptor {
public:
    template <typename T>
    static TypeDescriptor of() {
        return TypeDescriptor(std::type_index(typeid(T)),
                              boost::typeindex::type_id<T>().pretty_name());
    }

    std::type_index index() const { return index_; }
    const std::string& name() const { return name_; }

    bool operator==(const TypeDescriptor& other) const {
        return index_ == other.index_;
    }
    bool operator!=(const TypeDescriptor& other) const {
        return !(*this == other);
    }

private:
    TypeDescriptor(std::type_index index, std::string name)
        : index_(index), name_(std::move(name)) {}

    std::type_index index_;
    std::string name_;
};

// Converts an instance of the declared type to one of its exposed bases
using UpCast =
    std::function<std::shared_ptr<void>(const std::shared_ptr<void>&)>;

struct ExposedType {
    TypeDescriptor type;
    UpCast up_cast;
};

template <typename Concrete, typename Exposed>
ExposedType make_exposed_type() {
    static_assert(std::is_base_of_v<Exposed, Concrete>,
                  "Exposed type must be a base of the bean type");
    return ExposedType{
        TypeDescriptor::of<Exposed>(),
        [](const std::shared_ptr<void>& instance) -> std::shared_ptr<void> {
            std::shared_ptr<Exposed> exposed =
                std::static_pointer_cast<Concrete>(instance);
            return exposed;
        }};
}

}  // namespace sprig::beans
