/**
 * @file blend_planner.hpp
 * @brief 混合规划器：把有序的混合描述栈编译为静态执行计划
 *
 * 左折叠：第 0 层合成到透明背景上，之后每层合成到上一步结果上。
 * 中间结果为线性 Rgba32F 临时槽，最后一步直接写目标槽，计划末尾回读目标槽。
 * 生成计划前完成全部校验，校验失败时不产生任何阶段。
 */

#pragma once

#include <pigment_color/blend_mode.hpp>
#include <pigment_color/pixel_format.hpp>
#include <pigment_pipeline/pipeline_cache.hpp>
#include <pigment_pipeline/plan.hpp>
#include <pigment_resource/pixel_buffer.hpp>
#include <pigment_resource/resource_arena.hpp>
#include <pigment_resource/slot_handle.hpp>

#include <memory>
#include <vector>

namespace pigment::pipeline {

/**
 * 一个合成步：把 source 以 mode 在 space 中合成到 destination 的累积结果上。
 * source 以 placement 为左上角放入 destination，须完全落在其内；矩形外保留累积结果。
 */
struct BlendDescriptor {
    resource::SlotHandle source{};
    resource::SlotHandle destination{};
    color::BlendMode mode = color::BlendMode::SourceOver;
    color::ColorSpace space = color::ColorSpace::Srgb;
    float opacity = 1.0f;
    color::Offset placement{};
};

/** 提交前写入 slot 的 CPU 像素 */
struct UploadRequest {
    resource::SlotHandle slot{};
    std::shared_ptr<const resource::PixelBuffer> pixels;
};

struct BlendRequest {
    std::vector<BlendDescriptor> stack;
    std::vector<UploadRequest> uploads;
    /** 回读目标，格式与尺寸须与目标槽一致 */
    std::shared_ptr<resource::PixelBuffer> download;
};

class BlendPlanner {
public:
    /** arena 与 cache 的生命周期须长于规划器 */
    BlendPlanner(const resource::ResourceArena* arena, PipelineCache* cache);

    /**
     * 校验请求并生成计划；所需管线经 PipelineCache 取得（可能等待构建）。
     * @throws Error(Validation) 空栈、目标不一致、源即目标、opacity 越界、上传目标不属于栈、缺少回读目标
     * @throws Error(StaleHandle) 句柄失效
     * @throws Error(IncompatibleFormats) 源矩形越出目标、通道类别不可桥接、上传/回读缓冲与槽不符
     * @throws Error(UnsupportedMode) (mode, space, 输出格式) 无已注册内核
     */
    Plan BuildPlan(const BlendRequest& request) const;

private:
    const resource::ResourceArena* arena_ = nullptr;
    PipelineCache* cache_ = nullptr;
};

}  // namespace pigment::pipeline
