/**
 * @file pipeline_key.hpp
 * @brief 计算管线键与 blend.comp 的绑定布局约定
 *
 * 每个 (混合模式, 求值颜色空间, 输出格式) 组合对应一条特化后的计算管线。
 * 特化常量：constant_id 0 = mode，1 = space，2 = 输出 layout，3 = 输出编码空间。
 * 存储缓冲：binding 0 = backdrop，1 = source，2 = output。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <pigment_color/blend_mode.hpp>
#include <pigment_color/pixel_format.hpp>

namespace pigment::pipeline {

/** 构建期生成的着色器产物文件名（位于 PIGMENT_SHADER_DIR） */
inline constexpr const char* kBlendShaderFile = "blend.comp.spv";

/** local_size_x / local_size_y */
inline constexpr std::uint32_t kBlendWorkgroupSize = 16;
inline constexpr std::uint32_t kBlendStorageBufferCount = 3;

/** BlendPushConstants::flags：无 backdrop，binding 0 不被读取 */
inline constexpr std::uint32_t kBlendFlagTransparentBackdrop = 1u << 0;

/**
 * 与 blend.comp 中 push_constant 块逐字段对应（std430，40 字节）。
 * width/height 为输出尺寸；源以 (offsetX, offsetY) 放置，尺寸 sourceWidth x sourceHeight。
 * 源矩形之外的像素原样保留 backdrop（透明 backdrop 时为全零）。
 */
struct BlendPushConstants {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t sourceWidth = 0;
    std::uint32_t sourceHeight = 0;
    std::uint32_t offsetX = 0;
    std::uint32_t offsetY = 0;
    std::uint32_t sourceLayout = 0;
    std::uint32_t sourceSpace = 0;
    float opacity = 1.0f;
    std::uint32_t flags = 0;
};

static_assert(sizeof(BlendPushConstants) == 40, "push constant layout must match blend.comp");

struct PipelineKey {
    color::BlendMode mode = color::BlendMode::SourceOver;
    color::ColorSpace space = color::ColorSpace::Srgb;
    color::PixelFormat outputFormat{};

    bool operator==(const PipelineKey& other) const {
        return mode == other.mode && space == other.space && outputFormat == other.outputFormat;
    }
    bool operator!=(const PipelineKey& other) const { return !(*this == other); }
};

struct PipelineKeyHash {
    std::size_t operator()(const PipelineKey& key) const {
        std::uint32_t packed = static_cast<std::uint32_t>(key.mode) |
                               (static_cast<std::uint32_t>(key.space) << 8) |
                               (static_cast<std::uint32_t>(key.outputFormat.layout) << 16) |
                               (static_cast<std::uint32_t>(key.outputFormat.space) << 24);
        return std::hash<std::uint32_t>{}(packed);
    }
};

/** 形如 "Multiply/Srgb -> Rgba8/Srgb"，用于错误消息 */
std::string ToString(const PipelineKey& key);

/** 按 constant_id 顺序排列的特化常量 */
std::vector<std::uint32_t> MakeSpecializationConstants(const PipelineKey& key);

}  // namespace pigment::pipeline
