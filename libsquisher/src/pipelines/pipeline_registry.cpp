#include "../../include/pipeline_registry.hpp"
#include "../../include/generic_pipeline.hpp"
#include "../../include/image_pipeline.hpp"

namespace squisher {

PipelineRegistry::PipelineRegistry(const Config& config) {
    pipelines_.push_back(std::make_unique<GenericCompressionPipeline>(config.compression));
    pipelines_.push_back(std::make_unique<ImageTranscodingPipeline>(config.images));
}

const IPipeline* PipelineRegistry::find(const FileCategory category) const {
    for (const auto& pipeline : pipelines_) {
        if (pipeline->category() == category) {
            return pipeline.get();
        }
    }
    return nullptr;
}

} // namespace squisher
