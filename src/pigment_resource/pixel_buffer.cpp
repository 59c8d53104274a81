/**
 * @file pixel_buffer.cpp
 * @brief PixelBuffer 实现
 */

#include <pigment_resource/pixel_buffer.hpp>

#include <pigment_color/color_space.hpp>
#include <pigment_core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace pigment::resource {

PixelBuffer::PixelBuffer(const color::PixelFormat& format, std::uint32_t width,
                         std::uint32_t height)
    : format_(format), width_(width), height_(height),
      bytes_(static_cast<std::size_t>(width) * height * color::BytesPerPixel(format.layout), 0) {}

PixelBuffer::PixelBuffer(const color::PixelFormat& format, std::uint32_t width,
                         std::uint32_t height, std::vector<std::uint8_t> bytes)
    : format_(format), width_(width), height_(height), bytes_(std::move(bytes)) {
    const std::size_t expected =
        static_cast<std::size_t>(width) * height * color::BytesPerPixel(format.layout);
    if (bytes_.size() != expected) {
        throw Error(ErrorCode::Validation,
                    "PixelBuffer: byte size " + std::to_string(bytes_.size()) +
                        " does not match " + std::to_string(width) + "x" + std::to_string(height) +
                        " " + color::ToString(format.layout));
    }
}

PixelBuffer PixelBuffer::Solid(const color::PixelFormat& format, const color::Extent& extent,
                               const glm::vec4& linearColor) {
    PixelBuffer buffer(format, extent.width, extent.height);
    const std::size_t bpp = color::BytesPerPixel(format.layout);
    if (buffer.bytes_.empty()) return buffer;
    color::EncodeTexel(linearColor, format, buffer.bytes_.data());
    for (std::size_t offset = bpp; offset < buffer.bytes_.size(); offset += bpp) {
        std::copy(buffer.bytes_.begin(), buffer.bytes_.begin() + static_cast<std::ptrdiff_t>(bpp),
                  buffer.bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return buffer;
}

std::size_t PixelBuffer::TexelOffset(std::uint32_t x, std::uint32_t y) const {
    if (x >= width_ || y >= height_) {
        throw Error(ErrorCode::Validation, "PixelBuffer: texel (" + std::to_string(x) + ", " +
                                               std::to_string(y) + ") out of range");
    }
    return (static_cast<std::size_t>(y) * width_ + x) * color::BytesPerPixel(format_.layout);
}

glm::vec4 PixelBuffer::GetTexel(std::uint32_t x, std::uint32_t y) const {
    return color::DecodeTexel(bytes_.data() + TexelOffset(x, y), format_);
}

void PixelBuffer::SetTexel(std::uint32_t x, std::uint32_t y, const glm::vec4& linear) {
    color::EncodeTexel(linear, format_, bytes_.data() + TexelOffset(x, y));
}

const std::uint8_t* PixelBuffer::GetTexelBytes(std::uint32_t x, std::uint32_t y) const {
    return bytes_.data() + TexelOffset(x, y);
}

}  // namespace pigment::resource
