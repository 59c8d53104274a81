/**
 * @file tolerance.cpp
 * @brief 容差比较实现
 */

#include <pigment_engine/tolerance.hpp>

#include <pigment_core/error.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>

namespace pigment {

namespace {

std::size_t ChannelCount(color::PixelLayout layout) {
    return layout == color::PixelLayout::R8 ? 1u : 4u;
}

std::uint32_t ChannelDelta(const std::uint8_t* a, const std::uint8_t* b, std::size_t channel,
                           color::PixelLayout layout) {
    if (layout == color::PixelLayout::Rgba32F) {
        float fa = 0.0f;
        float fb = 0.0f;
        std::memcpy(&fa, a + channel * sizeof(float), sizeof(float));
        std::memcpy(&fb, b + channel * sizeof(float), sizeof(float));
        if (std::isnan(fa) || std::isnan(fb)) return std::isnan(fa) && std::isnan(fb) ? 0u : 255u;
        return static_cast<std::uint32_t>(std::lround(std::fabs(fa - fb) * 255.0f));
    }
    const int d = static_cast<int>(a[channel]) - static_cast<int>(b[channel]);
    return static_cast<std::uint32_t>(d < 0 ? -d : d);
}

}  // namespace

ToleranceReport CompareWithinTolerance(const resource::PixelBuffer& actual,
                                       const resource::PixelBuffer& expected,
                                       const ToleranceConfig& config) {
    if (actual.GetFormat() != expected.GetFormat() || actual.GetExtent() != expected.GetExtent())
        throw Error(ErrorCode::IncompatibleFormats,
                    "CompareWithinTolerance: buffers differ in format or extent");

    ToleranceReport report;
    const color::PixelLayout layout = actual.GetFormat().layout;
    const std::size_t channels = ChannelCount(layout);
    for (std::uint32_t y = 0; y < actual.GetHeight(); ++y) {
        for (std::uint32_t x = 0; x < actual.GetWidth(); ++x) {
            const std::uint8_t* a = actual.GetTexelBytes(x, y);
            const std::uint8_t* b = expected.GetTexelBytes(x, y);
            for (std::size_t c = 0; c < channels; ++c) {
                const std::uint32_t delta = ChannelDelta(a, b, c, layout);
                ++report.comparedChannels;
                if (delta > report.maxDelta) report.maxDelta = delta;
                if (delta > config.maxChannelDelta) {
                    if (report.mismatchedChannels == 0) {
                        report.firstMismatchX = x;
                        report.firstMismatchY = y;
                    }
                    ++report.mismatchedChannels;
                }
            }
        }
    }
    return report;
}

ToleranceConfig ToleranceFromEnvironment(const ToleranceConfig& defaults) {
    ToleranceConfig config = defaults;
    const char* value = std::getenv("PIGMENT_CHANNEL_TOLERANCE");
    if (!value || *value == '\0') return config;
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(value, &end, 10);
    if (end && *end == '\0' && parsed <= 255ul)
        config.maxChannelDelta = static_cast<std::uint32_t>(parsed);
    return config;
}

}  // namespace pigment
