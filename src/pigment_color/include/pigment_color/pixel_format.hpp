/**
 * @file pixel_format.hpp
 * @brief 像素存储格式：通道布局、颜色空间（传递函数）与尺寸
 *
 * PixelLayout 描述字节排布，ColorSpace 描述颜色通道的编码方式。
 * Alpha 通道始终为线性存储。
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace pigment::color {

/** 通道编码方式；数值与着色器特化常量一致，勿调整顺序 */
enum class ColorSpace : std::uint32_t {
    Linear = 0,
    Srgb = 1,
    Bt709 = 2,
};

/** 每像素字节布局；数值与着色器 push constant 一致 */
enum class PixelLayout : std::uint32_t {
    Rgba8 = 0,
    Bgra8 = 1,
    Rgba32F = 2,
    R8 = 3,
};

struct PixelFormat {
    PixelLayout layout = PixelLayout::Rgba8;
    ColorSpace space = ColorSpace::Srgb;

    bool operator==(const PixelFormat& other) const {
        return layout == other.layout && space == other.space;
    }
    bool operator!=(const PixelFormat& other) const { return !(*this == other); }
};

struct Extent {
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    bool IsEmpty() const { return width == 0 || height == 0; }
    std::size_t PixelCount() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    bool operator==(const Extent& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Extent& other) const { return !(*this == other); }
};

/** 图层在目标画布中的左上角位置（像素） */
struct Offset {
    std::uint32_t x = 0;
    std::uint32_t y = 0;

    bool operator==(const Offset& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Offset& other) const { return !(*this == other); }
};

/** 以 offset 放置的 extent 是否完全落在 bounds 内 */
bool FitsWithin(const Offset& offset, const Extent& extent, const Extent& bounds);

/** 通道族：RGBA 系（Rgba8/Bgra8/Rgba32F）可互相桥接，单通道 R8 自成一类 */
enum class ChannelClass {
    Rgba,
    Single,
};

std::size_t BytesPerPixel(PixelLayout layout);
ChannelClass GetChannelClass(PixelLayout layout);

/**
 * source 能否经颜色模型合成到 destination。
 * 同通道族可互通；R8 作为源时按灰度 (r, r, r, 1) 进入 RGBA 系目标，反向不成立。
 */
bool IsBridgeable(const PixelFormat& source, const PixelFormat& destination);

const char* ToString(PixelLayout layout);
const char* ToString(ColorSpace space);

// 常用格式
inline constexpr PixelFormat kRgba8Srgb{PixelLayout::Rgba8, ColorSpace::Srgb};
inline constexpr PixelFormat kBgra8Srgb{PixelLayout::Bgra8, ColorSpace::Srgb};
inline constexpr PixelFormat kRgba8Linear{PixelLayout::Rgba8, ColorSpace::Linear};
/** 规划器中间结果格式：线性浮点、非预乘 alpha */
inline constexpr PixelFormat kRgba32FLinear{PixelLayout::Rgba32F, ColorSpace::Linear};

}  // namespace pigment::color
