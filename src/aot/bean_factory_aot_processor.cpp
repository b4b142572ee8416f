#include "sprig/aot/bean_factory_aot_processor.hpp"

#include <algorithm>

#include "sprig/log/logger.hpp"

namespace sprig::aot {

bool ProcessorTracker::should_skip(const std::string& processor,
                                   const std::string& factory_name) const {
    auto it = processed_.find(processor);
    if (it == processed_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), factory_name) !=
           it->second.end();
}

void ProcessorTracker::mark_processed(const std::string& processor,
                                      const std::string& factory_name) {
    if (should_skip(processor, factory_name)) return;
    processed_[processor].push_back(factory_name);
}

std::vector<std::string> ProcessorTracker::processed_factories(
    const std::string& processor) const {
    auto it = processed_.find(processor);
    return it == processed_.end() ? std::vector<std::string>{} : it->second;
}

void ProcessorTracker::save(GeneratedFiles& files) const {
    for (const auto& [processor, factories] : processed_) {
        std::string content;
        for (const auto& factory : factories) {
            content += factory + "\n";
        }
        files.add_resource_file(std::string(DIRECTORY) + processor +
                                    ".processed",
                                std::move(content));
        SPRIG_LOG_TRACE << "Saved tracking manifest for processor "
                        << processor;
    }
}

}  // namespace sprig::aot
