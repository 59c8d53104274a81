/**
 * @file pixel_buffer.hpp
 * @brief CPU 侧像素缓冲：合成的输入图层与回读结果
 *
 * 字节按行紧密排列（无行间填充），texel 编码由 PixelFormat 决定。
 */

#pragma once

#include <pigment_color/pixel_format.hpp>

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pigment::resource {

class PixelBuffer {
public:
    PixelBuffer() = default;

    /** 分配 width*height 个 texel，字节清零 */
    PixelBuffer(const color::PixelFormat& format, std::uint32_t width, std::uint32_t height);

    /** 接管已编码的字节；大小不等于 width*height*BytesPerPixel 时抛出 Error(Validation) */
    PixelBuffer(const color::PixelFormat& format, std::uint32_t width, std::uint32_t height,
                std::vector<std::uint8_t> bytes);

    /** 以线性直通 alpha 颜色填充整幅缓冲 */
    static PixelBuffer Solid(const color::PixelFormat& format, const color::Extent& extent,
                             const glm::vec4& linearColor);

    const color::PixelFormat& GetFormat() const { return format_; }
    color::Extent GetExtent() const { return color::Extent{width_, height_}; }
    std::uint32_t GetWidth() const { return width_; }
    std::uint32_t GetHeight() const { return height_; }
    bool IsEmpty() const { return bytes_.empty(); }

    std::size_t GetByteSize() const { return bytes_.size(); }
    const std::uint8_t* GetData() const { return bytes_.data(); }
    std::uint8_t* GetData() { return bytes_.data(); }
    const std::vector<std::uint8_t>& GetBytes() const { return bytes_; }

    /** 读取 (x, y) 处 texel，解码为线性直通 alpha RGBA */
    glm::vec4 GetTexel(std::uint32_t x, std::uint32_t y) const;
    void SetTexel(std::uint32_t x, std::uint32_t y, const glm::vec4& linear);

    /** 原始存储字节（Rgba8/Bgra8 为 8 位分量，便于按 LSB 比较） */
    const std::uint8_t* GetTexelBytes(std::uint32_t x, std::uint32_t y) const;

private:
    std::size_t TexelOffset(std::uint32_t x, std::uint32_t y) const;

    color::PixelFormat format_{};
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::vector<std::uint8_t> bytes_;
};

}  // namespace pigment::resource
