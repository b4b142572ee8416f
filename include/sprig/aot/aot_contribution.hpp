#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "sprig/aot/class_name_generator.hpp"
#include "sprig/aot/generated_factories.hpp"
#include "sprig/aot/generated_files.hpp"

namespace sprig::aot {

class ContributionQueue;

/**
 * @brief Everything a contribution can write to while it is applied
 */
class GenerationContext {
public:
    GenerationContext(GeneratedFiles& files, GeneratedFactories& factories,
                      ClassNameGenerator& class_names, ContributionQueue& queue,
                      std::vector<std::string> extra_includes = {})
        : files_(files),
          factories_(factories),
          class_names_(class_names),
          queue_(queue),
          extra_includes_(std::move(extra_includes)) {}

    GeneratedFiles& files() { return files_; }
    GeneratedFactories& factories() { return factories_; }
    ClassNameGenerator& class_names() { return class_names_; }
    ContributionQueue& queue() { return queue_; }
    // Headers every generated registration source includes
    const std::vector<std::string>& extra_includes() const {
        return extra_includes_;
    }

    // True the first time a key is seen in this context
    bool mark_once(const std::string& key) {
        return once_keys_.insert(key).second;
    }

private:
    GeneratedFiles& files_;
    GeneratedFactories& factories_;
    ClassNameGenerator& class_names_;
    ContributionQueue& queue_;
    std::vector<std::string> extra_includes_;
    std::set<std::string> once_keys_;
};

/**
 * @brief Deferred unit of generation work
 *
 * Applying a contribution may enqueue further contributions through the
 * context's queue.
 */
class AotContribution {
public:
    virtual ~AotContribution() = default;

    virtual void apply_to(GenerationContext& context) = 0;
    virtual std::string description() const = 0;
};

/**
 * @brief FIFO of pending contributions
 */
class ContributionQueue {
public:
    void enqueue(std::unique_ptr<AotContribution> contribution);

    std::size_t size() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }

    // Applies contributions front to back until none are left, including
    // those enqueued while draining. Returns how many were applied.
    std::size_t drain(GenerationContext& context);

private:
    std::deque<std::unique_ptr<AotContribution>> pending_;
};

}  // namespace sprig::aot
