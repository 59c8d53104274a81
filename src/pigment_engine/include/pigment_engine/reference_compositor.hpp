/**
 * @file reference_compositor.hpp
 * @brief CPU 参考合成：与 GPU 路径相同的左折叠，逐 texel 调用 CompositeTexel
 *
 * 中间结果保持 float（对应 GPU 的线性 Rgba32F 临时槽），只在输出时编码一次。
 * 用于校验 GPU 结果与 test_direct 的纯 CPU 场景。
 */

#pragma once

#include <pigment_color/pixel_format.hpp>
#include <pigment_engine/layer.hpp>
#include <pigment_resource/pixel_buffer.hpp>

#include <vector>

namespace pigment {

/**
 * @throws Error(Validation) 无图层、图层无像素或 opacity 越界
 * @throws Error(IncompatibleFormats) 图层越出画布（图层 0 的尺寸）或通道类别不可桥接
 * @throws Error(UnsupportedMode) 输出为 R8
 */
resource::PixelBuffer CompositeReference(const std::vector<Layer>& layers,
                                         const color::PixelFormat& outputFormat);

}  // namespace pigment
