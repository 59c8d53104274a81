// Blend Check - 在真实计算设备上逐模式、逐颜色空间测量 GPU 与 CPU 参考合成的最大通道差
// 用法: blend_check [shader_dir] [width] [height]

#include <pigment_core/error.hpp>
#include <pigment_engine/compositor.hpp>
#include <pigment_engine/layer.hpp>
#include <pigment_engine/reference_compositor.hpp>
#include <pigment_engine/tolerance.hpp>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using pigment::resource::PixelBuffer;
using namespace pigment::color;

PixelBuffer Noise(const PixelFormat& format, const Extent& extent, std::uint32_t seed) {
    PixelBuffer buffer(format, extent.width, extent.height);
    std::uint32_t state = seed * 2654435761u + 1u;
    for (std::uint32_t y = 0; y < extent.height; ++y) {
        for (std::uint32_t x = 0; x < extent.width; ++x) {
            glm::vec4 c;
            for (int i = 0; i < 4; ++i) {
                state ^= state << 13;
                state ^= state >> 17;
                state ^= state << 5;
                c[i] = static_cast<float>(state & 0xFFFFu) / 65535.0f;
            }
            buffer.SetTexel(x, y, c);
        }
    }
    return buffer;
}

std::uint32_t ParseDimension(const char* arg, std::uint32_t fallback) {
    if (!arg) return fallback;
    const long value = std::strtol(arg, nullptr, 10);
    return value > 0 ? static_cast<std::uint32_t>(value) : fallback;
}

}  // namespace

int main(int argc, char** argv) {
    pigment::CompositorConfig config;
    if (argc > 1) config.shaderPath = argv[1];
    const Extent extent{ParseDimension(argc > 2 ? argv[2] : nullptr, 256),
                        ParseDimension(argc > 3 ? argv[3] : nullptr, 256)};

    pigment::Compositor compositor;
    if (!compositor.Initialize(config)) {
        std::cerr << "Compositor initialization failed: " << compositor.GetLastError() << std::endl;
        return 1;
    }
    std::cout << "Device: " << compositor.GetDevice()->GetCapabilities().deviceName << "\n"
              << "Extent: " << extent.width << "x" << extent.height << "\n\n";

    const pigment::ToleranceConfig tolerance = pigment::ToleranceFromEnvironment();
    const ColorSpace spaces[] = {ColorSpace::Linear, ColorSpace::Srgb, ColorSpace::Bt709};

    std::cout << std::left << std::setw(12) << "mode";
    for (ColorSpace space : spaces) std::cout << std::setw(10) << ToString(space);
    std::cout << "\n";

    bool allWithin = true;
    try {
        for (std::uint32_t m = 0; m < kBlendModeCount; ++m) {
            const auto mode = static_cast<BlendMode>(m);
            std::cout << std::setw(12) << ToString(mode);
            for (ColorSpace space : spaces) {
                std::vector<pigment::Layer> layers;
                layers.push_back(pigment::MakeLayer(Noise(kRgba8Srgb, extent, 1)));
                layers.push_back(pigment::MakeLayer(Noise(kRgba8Srgb, extent, 2 + m), mode, space,
                                                    0.8f));
                const PixelBuffer gpu = compositor.Composite(layers, kRgba8Srgb).Get();
                const PixelBuffer cpu = pigment::CompositeReference(layers, kRgba8Srgb);
                const pigment::ToleranceReport report =
                    pigment::CompareWithinTolerance(gpu, cpu, tolerance);
                if (!report.WithinTolerance()) allWithin = false;
                std::cout << std::setw(10)
                          << (std::to_string(report.maxDelta) +
                              (report.WithinTolerance() ? "" : "!"));
            }
            std::cout << "\n";
        }
    } catch (const pigment::Error& e) {
        std::cerr << "\nComposite failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nTolerance: " << tolerance.maxChannelDelta << " LSB, "
              << (allWithin ? "all within tolerance" : "MISMATCH") << std::endl;
    compositor.Shutdown();
    return allWithin ? 0 : 1;
}
