/**
 * @file blend_mode.cpp
 * @brief 混合公式与单步合成实现
 */

#include <pigment_color/blend_mode.hpp>
#include <pigment_color/color_space.hpp>

#include <algorithm>
#include <cmath>

namespace pigment::color {

namespace {

float Multiply(float cb, float cs) { return cb * cs; }

float Screen(float cb, float cs) { return cb + cs - cb * cs; }

float HardLight(float cb, float cs) {
    return cs <= 0.5f ? Multiply(cb, 2.0f * cs) : Screen(cb, 2.0f * cs - 1.0f);
}

}  // namespace

const char* ToString(BlendMode mode) {
    switch (mode) {
        case BlendMode::SourceOver: return "SourceOver";
        case BlendMode::Multiply: return "Multiply";
        case BlendMode::Screen: return "Screen";
        case BlendMode::Overlay: return "Overlay";
        case BlendMode::Darken: return "Darken";
        case BlendMode::Lighten: return "Lighten";
        case BlendMode::Difference: return "Difference";
        case BlendMode::HardLight: return "HardLight";
        case BlendMode::Additive: return "Additive";
        default: return "Unknown";
    }
}

float BlendChannel(BlendMode mode, float cb, float cs) {
    switch (mode) {
        case BlendMode::SourceOver: return cs;
        case BlendMode::Multiply: return Multiply(cb, cs);
        case BlendMode::Screen: return Screen(cb, cs);
        case BlendMode::Overlay: return HardLight(cs, cb);
        case BlendMode::Darken: return std::min(cb, cs);
        case BlendMode::Lighten: return std::max(cb, cs);
        case BlendMode::Difference: return std::fabs(cb - cs);
        case BlendMode::HardLight: return HardLight(cb, cs);
        case BlendMode::Additive: return std::min(1.0f, cb + cs);
        default: return cs;
    }
}

glm::vec4 CompositeTexel(const glm::vec4& backdrop, const glm::vec4& source, BlendMode mode,
                         ColorSpace space, float opacity) {
    const float as = source.a * std::clamp(opacity, 0.0f, 1.0f);
    const float ab = backdrop.a;
    const float ao = as + ab * (1.0f - as);
    if (ab <= 0.0f) {
        return glm::vec4(glm::vec3(source), as);
    }
    if (ao <= 0.0f) {
        return glm::vec4(0.0f);
    }

    const glm::vec3 cb = FromLinear(glm::vec3(backdrop), space);
    const glm::vec3 cs = FromLinear(glm::vec3(source), space);
    glm::vec3 co;
    for (int i = 0; i < 3; ++i) {
        const float cm = (1.0f - ab) * cs[i] + ab * BlendChannel(mode, cb[i], cs[i]);
        co[i] = (as * cm + ab * cb[i] * (1.0f - as)) / ao;
    }
    return glm::vec4(ToLinear(co, space), ao);
}

}  // namespace pigment::color
