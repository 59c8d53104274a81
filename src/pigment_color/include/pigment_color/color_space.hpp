/**
 * @file color_space.hpp
 * @brief 颜色模型：编码值与线性值互转、8 位量化、纹素解码/编码
 *
 * 全部为纯函数，无 GPU / 异步依赖。输入越界时截断到 [0,1]。
 * 8 位量化使用 round-to-nearest ties-to-even，保证
 * FromLinear8(ToLinear8(x, s), s) == x 对全部 256 个取值成立。
 */

#pragma once

#include <cstdint>

#include <glm/glm.hpp>

#include <pigment_color/pixel_format.hpp>

namespace pigment::color {

/** 编码值 → 线性值（sRGB EOTF、Bt.709 反 OETF，Linear 为恒等） */
float ToLinear(float encoded, ColorSpace space);

/** 线性值 → 编码值（不量化） */
float FromLinear(float linear, ColorSpace space);

glm::vec3 ToLinear(const glm::vec3& encoded, ColorSpace space);
glm::vec3 FromLinear(const glm::vec3& linear, ColorSpace space);

/** [0,1] 浮点量化为 8 位，ties-to-even；NaN 视为 0 */
std::uint8_t QuantizeUnorm8(float value);

float ToLinear8(std::uint8_t encoded, ColorSpace space);
std::uint8_t FromLinear8(float linear, ColorSpace space);

/**
 * 读取一个纹素为线性、非预乘 RGBA。
 * R8 解码为 (r, r, r, 1)。
 */
glm::vec4 DecodeTexel(const std::uint8_t* texel, const PixelFormat& format);

/** 将线性、非预乘 RGBA 按 format 编码写入 out（BytesPerPixel(format.layout) 字节） */
void EncodeTexel(const glm::vec4& linear, const PixelFormat& format, std::uint8_t* out);

}  // namespace pigment::color
