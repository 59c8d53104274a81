/**
 * @file layer.hpp
 * @brief 合成输入图层
 */

#pragma once

#include <pigment_color/blend_mode.hpp>
#include <pigment_color/pixel_format.hpp>
#include <pigment_resource/pixel_buffer.hpp>

#include <glm/glm.hpp>

#include <memory>

namespace pigment {

/**
 * 一个图层：像素、以何种模式在哪个颜色空间中合成到下方结果上、不透明度。
 * 像素以 shared_ptr 共享，提交后由会话持有直至上传完成。
 * offset 为图层在画布中的左上角；R8 图层按灰度合成。
 */
struct Layer {
    std::shared_ptr<const resource::PixelBuffer> pixels;
    color::BlendMode mode = color::BlendMode::SourceOver;
    color::ColorSpace space = color::ColorSpace::Srgb;
    float opacity = 1.0f;
    color::Offset offset{};
};

/** 纯色图层；linearColor 为线性直通 alpha RGBA */
Layer MakeSolidLayer(const color::PixelFormat& format, const color::Extent& extent,
                     const glm::vec4& linearColor,
                     color::BlendMode mode = color::BlendMode::SourceOver,
                     color::ColorSpace space = color::ColorSpace::Srgb, float opacity = 1.0f);

/** 以 PixelBuffer 构建图层（拷贝到共享所有权） */
Layer MakeLayer(resource::PixelBuffer pixels,
                color::BlendMode mode = color::BlendMode::SourceOver,
                color::ColorSpace space = color::ColorSpace::Srgb, float opacity = 1.0f);

}  // namespace pigment
