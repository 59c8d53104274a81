/**
 * @file pixel_format.cpp
 * @brief PixelLayout / ColorSpace 查询
 */

#include <pigment_color/pixel_format.hpp>

namespace pigment::color {

std::size_t BytesPerPixel(PixelLayout layout) {
    switch (layout) {
        case PixelLayout::Rgba8: return 4;
        case PixelLayout::Bgra8: return 4;
        case PixelLayout::Rgba32F: return 16;
        case PixelLayout::R8: return 1;
        default: return 0;
    }
}

ChannelClass GetChannelClass(PixelLayout layout) {
    return layout == PixelLayout::R8 ? ChannelClass::Single : ChannelClass::Rgba;
}

bool FitsWithin(const Offset& offset, const Extent& extent, const Extent& bounds) {
    return static_cast<std::uint64_t>(offset.x) + extent.width <= bounds.width &&
           static_cast<std::uint64_t>(offset.y) + extent.height <= bounds.height;
}

bool IsBridgeable(const PixelFormat& source, const PixelFormat& destination) {
    const ChannelClass from = GetChannelClass(source.layout);
    const ChannelClass to = GetChannelClass(destination.layout);
    return from == to || (from == ChannelClass::Single && to == ChannelClass::Rgba);
}

const char* ToString(PixelLayout layout) {
    switch (layout) {
        case PixelLayout::Rgba8: return "Rgba8";
        case PixelLayout::Bgra8: return "Bgra8";
        case PixelLayout::Rgba32F: return "Rgba32F";
        case PixelLayout::R8: return "R8";
        default: return "Unknown";
    }
}

const char* ToString(ColorSpace space) {
    switch (space) {
        case ColorSpace::Linear: return "Linear";
        case ColorSpace::Srgb: return "Srgb";
        case ColorSpace::Bt709: return "Bt709";
        default: return "Unknown";
    }
}

}  // namespace pigment::color
