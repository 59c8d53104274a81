/**
 * @file color_space.cpp
 * @brief 传递函数、量化与纹素编解码实现
 *
 * 常量与 shaders/blend.comp 中的 toLinear / fromLinear 保持一致。
 */

#include <pigment_color/color_space.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pigment::color {

namespace {

constexpr float kSrgbDecodeThreshold = 0.04045f;
constexpr float kSrgbEncodeThreshold = 0.0031308f;
constexpr float kBt709DecodeThreshold = 0.081f;
constexpr float kBt709EncodeThreshold = 0.018f;

float Saturate(float v) {
    if (std::isnan(v)) return 0.0f;
    return std::clamp(v, 0.0f, 1.0f);
}

}  // namespace

float ToLinear(float encoded, ColorSpace space) {
    const float v = Saturate(encoded);
    switch (space) {
        case ColorSpace::Srgb:
            return v <= kSrgbDecodeThreshold ? v / 12.92f
                                             : std::pow((v + 0.055f) / 1.055f, 2.4f);
        case ColorSpace::Bt709:
            return v < kBt709DecodeThreshold ? v / 4.5f
                                             : std::pow((v + 0.099f) / 1.099f, 1.0f / 0.45f);
        case ColorSpace::Linear:
        default:
            return v;
    }
}

float FromLinear(float linear, ColorSpace space) {
    const float v = Saturate(linear);
    switch (space) {
        case ColorSpace::Srgb:
            return v <= kSrgbEncodeThreshold ? v * 12.92f
                                             : 1.055f * std::pow(v, 1.0f / 2.4f) - 0.055f;
        case ColorSpace::Bt709:
            return v < kBt709EncodeThreshold ? v * 4.5f
                                             : 1.099f * std::pow(v, 0.45f) - 0.099f;
        case ColorSpace::Linear:
        default:
            return v;
    }
}

glm::vec3 ToLinear(const glm::vec3& encoded, ColorSpace space) {
    return glm::vec3(ToLinear(encoded.r, space), ToLinear(encoded.g, space),
                     ToLinear(encoded.b, space));
}

glm::vec3 FromLinear(const glm::vec3& linear, ColorSpace space) {
    return glm::vec3(FromLinear(linear.r, space), FromLinear(linear.g, space),
                     FromLinear(linear.b, space));
}

std::uint8_t QuantizeUnorm8(float value) {
    // 默认舍入模式 FE_TONEAREST 下 nearbyint 即 ties-to-even
    return static_cast<std::uint8_t>(std::nearbyint(Saturate(value) * 255.0f));
}

float ToLinear8(std::uint8_t encoded, ColorSpace space) {
    return ToLinear(static_cast<float>(encoded) / 255.0f, space);
}

std::uint8_t FromLinear8(float linear, ColorSpace space) {
    return QuantizeUnorm8(FromLinear(linear, space));
}

glm::vec4 DecodeTexel(const std::uint8_t* texel, const PixelFormat& format) {
    switch (format.layout) {
        case PixelLayout::Rgba8:
            return glm::vec4(ToLinear8(texel[0], format.space), ToLinear8(texel[1], format.space),
                             ToLinear8(texel[2], format.space),
                             static_cast<float>(texel[3]) / 255.0f);
        case PixelLayout::Bgra8:
            return glm::vec4(ToLinear8(texel[2], format.space), ToLinear8(texel[1], format.space),
                             ToLinear8(texel[0], format.space),
                             static_cast<float>(texel[3]) / 255.0f);
        case PixelLayout::Rgba32F: {
            float f[4];
            std::memcpy(f, texel, sizeof(f));
            return glm::vec4(ToLinear(f[0], format.space), ToLinear(f[1], format.space),
                             ToLinear(f[2], format.space), Saturate(f[3]));
        }
        case PixelLayout::R8: {
            const float v = ToLinear8(texel[0], format.space);
            return glm::vec4(v, v, v, 1.0f);
        }
        default:
            return glm::vec4(0.0f);
    }
}

void EncodeTexel(const glm::vec4& linear, const PixelFormat& format, std::uint8_t* out) {
    switch (format.layout) {
        case PixelLayout::Rgba8:
            out[0] = FromLinear8(linear.r, format.space);
            out[1] = FromLinear8(linear.g, format.space);
            out[2] = FromLinear8(linear.b, format.space);
            out[3] = QuantizeUnorm8(linear.a);
            break;
        case PixelLayout::Bgra8:
            out[0] = FromLinear8(linear.b, format.space);
            out[1] = FromLinear8(linear.g, format.space);
            out[2] = FromLinear8(linear.r, format.space);
            out[3] = QuantizeUnorm8(linear.a);
            break;
        case PixelLayout::Rgba32F: {
            const float f[4] = {FromLinear(linear.r, format.space),
                                FromLinear(linear.g, format.space),
                                FromLinear(linear.b, format.space), Saturate(linear.a)};
            std::memcpy(out, f, sizeof(f));
            break;
        }
        case PixelLayout::R8:
            out[0] = FromLinear8(linear.r, format.space);
            break;
        default:
            break;
    }
}

}  // namespace pigment::color
