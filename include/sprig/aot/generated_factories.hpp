#pragma once

#include <string>
#include <vector>

#include "sprig/aot/generated_files.hpp"

namespace sprig::aot {

/**
 * @brief Index from a factory key to the initializers generated for it
 *
 * Keys and initializers keep insertion order and are de-duplicated.
 * Serialized as
 * {"factories":[{"key":"default","initializers":["sprig_generated::..."]}]}
 */
class GeneratedFactories {
public:
    static constexpr const char* INDEX_PATH = "META-INF/sprig/factories.json";

    struct Entry {
        std::string key;
        std::vector<std::string> initializers;
    };

    // Blank keys or identifiers are ignored; both are trimmed
    void add(const std::string& key, const std::string& initializer);
    void merge(const GeneratedFactories& other);

    const std::vector<Entry>& entries() const { return entries_; }
    std::vector<std::string> initializers(const std::string& key) const;
    // Every initializer of every key, in index order
    std::vector<std::string> all_initializers() const;
    bool empty() const { return entries_.empty(); }

    std::string to_json() const;
    // Throws AotProcessingError on malformed content
    static GeneratedFactories parse(const std::string& json);

    void write_to(GeneratedFiles& files) const;

private:
    std::vector<Entry> entries_;
};

}  // namespace sprig::aot
