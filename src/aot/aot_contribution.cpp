#include "sprig/aot/aot_contribution.hpp"

#include "sprig/aot/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::aot {

void ContributionQueue::enqueue(std::unique_ptr<AotContribution> contribution) {
    if (!contribution) {
        throw AotProcessingError("Cannot enqueue a null contribution");
    }
    SPRIG_LOG_TRACE << "Enqueued contribution: "
                    << contribution->description();
    pending_.push_back(std::move(contribution));
}

std::size_t ContributionQueue::drain(GenerationContext& context) {
    std::size_t applied = 0;
    while (!pending_.empty()) {
        std::unique_ptr<AotContribution> contribution =
            std::move(pending_.front());
        pending_.pop_front();

        const std::string description = contribution->description();
        SPRIG_LOG_DEBUG << "Applying contribution: " << description;
        try {
            contribution->apply_to(context);
        } catch (const AotProcessingError& e) {
            SPRIG_LOG_ERROR << "Contribution '" << description
                            << "' failed: " << e.what();
            throw;
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Contribution '" << description
                            << "' failed: " << e.what();
            throw AotProcessingError("Contribution '" + description +
                                     "' failed: " + e.what());
        }
        ++applied;
    }
    return applied;
}

}  // namespace sprig::aot
