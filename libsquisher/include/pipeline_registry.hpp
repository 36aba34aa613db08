/**
 * @file pipeline_registry.hpp
 * @brief Owns one pipeline per processable FileCategory.
 */

#ifndef SQUISHER_PIPELINE_REGISTRY_HPP
#define SQUISHER_PIPELINE_REGISTRY_HPP

#include "config.hpp"
#include "pipeline.hpp"
#include <memory>
#include <vector>

namespace squisher {

/**
 * @brief Registry of the built-in pipelines.
 *
 * @details Built once per run from the validated Config and shared by
 * every worker of the ParallelExecutor.
 */
class PipelineRegistry {
public:
    explicit PipelineRegistry(const Config& config);

    /**
     * @brief Pipeline for @p category.
     * @return nullptr for FileCategory::AlreadyCompressed, which has none.
     */
    [[nodiscard]] const IPipeline* find(FileCategory category) const;

private:
    std::vector<std::unique_ptr<IPipeline>> pipelines_;
};

} // namespace squisher

#endif // SQUISHER_PIPELINE_REGISTRY_HPP
