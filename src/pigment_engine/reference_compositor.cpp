/**
 * @file reference_compositor.cpp
 * @brief CompositeReference 实现
 */

#include <pigment_engine/reference_compositor.hpp>

#include <pigment_color/blend_mode.hpp>
#include <pigment_color/color_space.hpp>
#include <pigment_core/error.hpp>

#include <string>

namespace pigment {

resource::PixelBuffer CompositeReference(const std::vector<Layer>& layers,
                                         const color::PixelFormat& outputFormat) {
    if (layers.empty()) throw Error(ErrorCode::Validation, "CompositeReference: no layers");

    for (std::size_t i = 0; i < layers.size(); ++i) {
        const Layer& layer = layers[i];
        if (!layer.pixels || layer.pixels->IsEmpty())
            throw Error(ErrorCode::Validation,
                        "CompositeReference: layer " + std::to_string(i) + " has no pixels");
        if (!(layer.opacity >= 0.0f && layer.opacity <= 1.0f))
            throw Error(ErrorCode::Validation,
                        "CompositeReference: layer " + std::to_string(i) + " opacity outside [0,1]");
        if (!color::FitsWithin(layer.offset, layer.pixels->GetExtent(),
                               layers.front().pixels->GetExtent()))
            throw Error(ErrorCode::IncompatibleFormats,
                        "CompositeReference: layer " + std::to_string(i) +
                            " does not fit the canvas");
        if (!color::IsBridgeable(layer.pixels->GetFormat(), outputFormat))
            throw Error(ErrorCode::IncompatibleFormats,
                        "CompositeReference: layer " + std::to_string(i) +
                            " cannot bridge to the output format");
    }

    if (outputFormat.layout == color::PixelLayout::R8)
        throw Error(ErrorCode::UnsupportedMode, "CompositeReference: R8 output has no kernel");

    const color::Extent extent = layers.front().pixels->GetExtent();
    resource::PixelBuffer out(outputFormat, extent.width, extent.height);
    for (std::uint32_t y = 0; y < extent.height; ++y) {
        for (std::uint32_t x = 0; x < extent.width; ++x) {
            glm::vec4 acc(0.0f);
            for (const Layer& layer : layers) {
                const color::Extent e = layer.pixels->GetExtent();
                if (x < layer.offset.x || y < layer.offset.y || x - layer.offset.x >= e.width ||
                    y - layer.offset.y >= e.height)
                    continue;
                const glm::vec4 src = layer.pixels->GetTexel(x - layer.offset.x, y - layer.offset.y);
                acc = color::CompositeTexel(acc, src, layer.mode, layer.space, layer.opacity);
            }
            out.SetTexel(x, y, acc);
        }
    }
    return out;
}

}  // namespace pigment
