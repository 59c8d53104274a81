/**
 * @file layer.cpp
 * @brief 图层构建辅助
 */

#include <pigment_engine/layer.hpp>

#include <utility>

namespace pigment {

Layer MakeSolidLayer(const color::PixelFormat& format, const color::Extent& extent,
                     const glm::vec4& linearColor, color::BlendMode mode,
                     color::ColorSpace space, float opacity) {
    return MakeLayer(resource::PixelBuffer::Solid(format, extent, linearColor), mode, space,
                     opacity);
}

Layer MakeLayer(resource::PixelBuffer pixels, color::BlendMode mode, color::ColorSpace space,
                float opacity) {
    Layer layer;
    layer.pixels = std::make_shared<const resource::PixelBuffer>(std::move(pixels));
    layer.mode = mode;
    layer.space = space;
    layer.opacity = opacity;
    return layer;
}

}  // namespace pigment
