#pragma once

#include <map>
#include <mutex>
#include <string>

namespace sprig::aot {

/**
 * @brief Hands out unique identifiers for generated classes
 *
 * "my-factory" + "BeanRegistrations" gives MyFactory_BeanRegistrations; a
 * second request for the same pair gives MyFactory_BeanRegistrations1.
 */
class ClassNameGenerator {
public:
    static constexpr const char* NAMESPACE = "sprig_generated";
    static constexpr const char* DEFAULT_NAME = "Aot";
    static constexpr const char* SEPARATOR = "_";

    // Unqualified class name
    std::string generate(const std::string& target_name,
                         const std::string& feature_name);
    // NAMESPACE::name
    static std::string qualify(const std::string& class_name);

    void reset();

    // Letters of the input, each run capitalised; DEFAULT_NAME when empty
    static std::string clean(const std::string& name);

private:
    std::mutex mutex_;
    std::map<std::string, int> sequence_;
};

}  // namespace sprig::aot
