#include "sprig/aot/generated_factories.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "sprig/aot/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::aot {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

}  // namespace

void GeneratedFactories::add(const std::string& key,
                             const std::string& initializer) {
    std::string clean_key = trim(key);
    std::string clean_initializer = trim(initializer);
    if (clean_key.empty() || clean_initializer.empty()) {
        SPRIG_LOG_DEBUG << "Ignoring blank factories index entry '" << key
                        << "' -> '" << initializer << "'";
        return;
    }

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.key == clean_key; });
    if (it == entries_.end()) {
        entries_.push_back(Entry{clean_key, {clean_initializer}});
        return;
    }
    auto& list = it->initializers;
    if (std::find(list.begin(), list.end(), clean_initializer) == list.end()) {
        list.push_back(clean_initializer);
    }
}

void GeneratedFactories::merge(const GeneratedFactories& other) {
    for (const auto& entry : other.entries_) {
        for (const auto& initializer : entry.initializers) {
            add(entry.key, initializer);
        }
    }
}

std::vector<std::string> GeneratedFactories::initializers(
    const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.key == key) return entry.initializers;
    }
    return {};
}

std::vector<std::string> GeneratedFactories::all_initializers() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        result.insert(result.end(), entry.initializers.begin(),
                      entry.initializers.end());
    }
    return result;
}

std::string GeneratedFactories::to_json() const {
    nlohmann::ordered_json root;
    root["factories"] = nlohmann::ordered_json::array();
    for (const auto& entry : entries_) {
        nlohmann::ordered_json item;
        item["key"] = entry.key;
        item["initializers"] = entry.initializers;
        root["factories"].push_back(std::move(item));
    }
    return root.dump(2) + "\n";
}

GeneratedFactories GeneratedFactories::parse(const std::string& json) {
    GeneratedFactories factories;
    try {
        auto root = nlohmann::ordered_json::parse(json);
        for (const auto& item : root.at("factories")) {
            const auto key = item.at("key").get<std::string>();
            for (const auto& initializer : item.at("initializers")) {
                factories.add(key, initializer.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw AotProcessingError(std::string("Malformed factories index: ") +
                                 e.what());
    }
    return factories;
}

void GeneratedFactories::write_to(GeneratedFiles& files) const {
    if (entries_.empty()) {
        SPRIG_LOG_DEBUG << "Writing an empty factories index";
    }
    files.add_resource_file(INDEX_PATH, to_json());
}

}  // namespace sprig::aot
