/**
 * @file pipeline_key.cpp
 * @brief PipelineKey 辅助函数
 */

#include <pigment_pipeline/pipeline_key.hpp>

namespace pigment::pipeline {

std::string ToString(const PipelineKey& key) {
    std::string s = color::ToString(key.mode);
    s += "/";
    s += color::ToString(key.space);
    s += " -> ";
    s += color::ToString(key.outputFormat.layout);
    s += "/";
    s += color::ToString(key.outputFormat.space);
    return s;
}

std::vector<std::uint32_t> MakeSpecializationConstants(const PipelineKey& key) {
    return {
        static_cast<std::uint32_t>(key.mode),
        static_cast<std::uint32_t>(key.space),
        static_cast<std::uint32_t>(key.outputFormat.layout),
        static_cast<std::uint32_t>(key.outputFormat.space),
    };
}

}  // namespace pigment::pipeline
