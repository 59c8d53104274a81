/**
 * @file blend_mode.hpp
 * @brief 混合模式公式（W3C Compositing Level 1 可分离模式）与单步合成
 *
 * 逐通道公式 B(Cb, Cs)，Cb 为背景、Cs 为源，取值 [0,1]：
 *   SourceOver  B = Cs
 *   Multiply    B = Cb * Cs
 *   Screen      B = Cb + Cs - Cb * Cs
 *   Overlay     B = HardLight(Cs, Cb)
 *   Darken      B = min(Cb, Cs)
 *   Lighten     B = max(Cb, Cs)
 *   Difference  B = |Cb - Cs|
 *   HardLight   B = Cs <= 0.5 ? Multiply(Cb, 2Cs) : Screen(Cb, 2Cs - 1)
 *   Additive    B = min(1, Cb + Cs)
 *
 * 单步合成（非预乘 alpha）：
 *   as = Sa * opacity, ab = Ba
 *   Cm = (1 - ab) * Cs + ab * B(Cb, Cs)
 *   ao = as + ab * (1 - as)
 *   co = ao > 0 ? (as * Cm + ab * Cb * (1 - as)) / ao : 0
 * 颜色在 space 指定的编码域内求值；ab == 0 时结果颜色即源颜色。
 * 着色器 blend.comp 必须与此处逐项一致。
 */

#pragma once

#include <cstdint>

#include <glm/glm.hpp>

#include <pigment_color/pixel_format.hpp>

namespace pigment::color {

/** 封闭的混合模式集合；数值即着色器特化常量，勿调整顺序 */
enum class BlendMode : std::uint32_t {
    SourceOver = 0,
    Multiply = 1,
    Screen = 2,
    Overlay = 3,
    Darken = 4,
    Lighten = 5,
    Difference = 6,
    HardLight = 7,
    Additive = 8,
};

inline constexpr std::uint32_t kBlendModeCount = 9;

const char* ToString(BlendMode mode);

/** 单通道混合函数 B(cb, cs) */
float BlendChannel(BlendMode mode, float cb, float cs);

/**
 * 单步合成：backdrop 与 source 均为线性、非预乘 RGBA，返回同样表示。
 * @param space 混合公式求值所在的颜色空间
 * @param opacity 图层不透明度，乘到源 alpha 上
 */
glm::vec4 CompositeTexel(const glm::vec4& backdrop, const glm::vec4& source, BlendMode mode,
                         ColorSpace space, float opacity = 1.0f);

}  // namespace pigment::color
