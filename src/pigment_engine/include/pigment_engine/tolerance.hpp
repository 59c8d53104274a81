/**
 * @file tolerance.hpp
 * @brief GPU 与 CPU 参考结果的逐通道容差比较
 *
 * 8 位布局按存储字节比较；Rgba32F 把差值换算为 1/255 单位后取整比较。
 */

#pragma once

#include <pigment_resource/pixel_buffer.hpp>

#include <cstddef>
#include <cstdint>

namespace pigment {

struct ToleranceConfig {
    /** 允许的最大单通道差（8 位 LSB） */
    std::uint32_t maxChannelDelta = 1;
};

struct ToleranceReport {
    std::uint32_t maxDelta = 0;
    std::size_t comparedChannels = 0;
    std::size_t mismatchedChannels = 0;
    /** 第一个超差 texel 的坐标（mismatchedChannels > 0 时有效） */
    std::uint32_t firstMismatchX = 0;
    std::uint32_t firstMismatchY = 0;

    bool WithinTolerance() const { return mismatchedChannels == 0; }
};

/** @throws Error(IncompatibleFormats) 两者格式或尺寸不同 */
ToleranceReport CompareWithinTolerance(const resource::PixelBuffer& actual,
                                       const resource::PixelBuffer& expected,
                                       const ToleranceConfig& config = ToleranceConfig{});

/** 读取环境变量 PIGMENT_CHANNEL_TOLERANCE 覆盖 maxChannelDelta；未设置或无法解析时返回 defaults */
ToleranceConfig ToleranceFromEnvironment(const ToleranceConfig& defaults = ToleranceConfig{});

}  // namespace pigment
