#include "sprig/aot/class_name_generator.hpp"

#include <algorithm>
#include <cctype>

#include "sprig/aot/exceptions.hpp"

namespace sprig::aot {

std::string ClassNameGenerator::clean(const std::string& name) {
    std::string result;
    bool capitalize_next = true;
    for (unsigned char c : name) {
        if (std::isalpha(c)) {
            result.push_back(capitalize_next
                                 ? static_cast<char>(std::toupper(c))
                                 : static_cast<char>(c));
            capitalize_next = false;
        } else {
            capitalize_next = true;
        }
    }
    return result.empty() ? std::string(DEFAULT_NAME) : result;
}

std::string ClassNameGenerator::generate(const std::string& target_name,
                                         const std::string& feature_name) {
    if (feature_name.empty() ||
        !std::all_of(feature_name.begin(), feature_name.end(),
                     [](unsigned char c) { return std::isalpha(c); })) {
        throw AotProcessingError("'" + feature_name +
                                 "' is not a valid feature name: letters only");
    }
    std::string feature = feature_name;
    feature[0] = static_cast<char>(
        std::toupper(static_cast<unsigned char>(feature[0])));
    std::string base = clean(target_name) + SEPARATOR + feature;

    std::lock_guard<std::mutex> lock(mutex_);
    int index = sequence_[base]++;
    return index == 0 ? base : base + std::to_string(index);
}

std::string ClassNameGenerator::qualify(const std::string& class_name) {
    return std::string(NAMESPACE) + "::" + class_name;
}

void ClassNameGenerator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.clear();
}

}  // namespace sprig::aot
