/**
 * @file test_direct.cpp
 * @brief 纯 CPU 合成场景：参考合成器、图层构建与容差比较，不需要计算设备
 *
 * 覆盖：红底叠 50% 白；单层恒等；multiply / screen / source-over 左折叠；
 * Bgra8 输入与 Rgba32F 输出；图层放置与 R8 灰度源；参考合成器的错误分类；容差报告与环境变量覆盖。
 */

#include <pigment_core/error.hpp>
#include <pigment_engine/layer.hpp>
#include <pigment_engine/reference_compositor.hpp>
#include <pigment_engine/tolerance.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

using pigment::Error;
using pigment::ErrorCode;
using pigment::Layer;
using pigment::resource::PixelBuffer;
using namespace pigment::color;

namespace {

/** 期望抛出指定错误码 */
template <typename F>
bool ThrowsCode(F&& f, ErrorCode code) {
    try {
        f();
    } catch (const Error& e) {
        return e.code() == code;
    }
    return false;
}

bool ByteNear(std::uint8_t a, int b, int eps = 1) {
    return std::abs(static_cast<int>(a) - b) <= eps;
}

/** 8 位 sRGB 值解码为线性 */
glm::vec4 Srgb8(int r, int g, int b, int a) {
    const std::uint8_t px[4] = {static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
                                static_cast<std::uint8_t>(b), static_cast<std::uint8_t>(a)};
    return DecodeTexel(px, kRgba8Srgb);
}

const Extent kExtent{4, 2};

}  // namespace

static void test_red_under_half_white() {
    std::vector<Layer> layers;
    layers.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(255, 0, 0, 255)));
    layers.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(255, 255, 255, 128)));

    PixelBuffer out = pigment::CompositeReference(layers, kRgba8Srgb);
    TEST_CHECK(out.GetExtent() == kExtent);
    for (std::uint32_t y = 0; y < kExtent.height; ++y) {
        for (std::uint32_t x = 0; x < kExtent.width; ++x) {
            const std::uint8_t* px = out.GetTexelBytes(x, y);
            TEST_CHECK(px[0] == 255);
            TEST_CHECK(ByteNear(px[1], 128));
            TEST_CHECK(ByteNear(px[2], 128));
            TEST_CHECK(px[3] == 255);
        }
    }

    // 同一结果也可由不透明白 + opacity 0.5 得到（差别只在 128/255 与 0.5）
    layers[1] = pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(255, 255, 255, 255),
                                        BlendMode::SourceOver, ColorSpace::Srgb, 0.5f);
    out = pigment::CompositeReference(layers, kRgba8Srgb);
    TEST_CHECK(ByteNear(out.GetTexelBytes(0, 0)[1], 128));
}

static void test_single_layer_identity() {
    PixelBuffer pixels(kRgba8Srgb, 16, 16);
    for (std::uint32_t y = 0; y < 16; ++y) {
        for (std::uint32_t x = 0; x < 16; ++x) {
            std::uint8_t* px = pixels.GetData() + (y * 16 + x) * 4;
            px[0] = static_cast<std::uint8_t>(x * 16);
            px[1] = static_cast<std::uint8_t>(y * 16);
            px[2] = static_cast<std::uint8_t>((x + y) * 7);
            px[3] = 255;
        }
    }
    const std::vector<std::uint8_t> original = pixels.GetBytes();

    for (std::uint32_t m = 0; m < kBlendModeCount; ++m) {
        std::vector<Layer> layers{pigment::MakeLayer(pixels, static_cast<BlendMode>(m))};
        PixelBuffer out = pigment::CompositeReference(layers, kRgba8Srgb);
        TEST_CHECK(out.GetBytes() == original);
    }
}

static void test_bgra_input_to_rgba_output() {
    PixelBuffer bgra(kBgra8Srgb, 2, 1);
    const std::uint8_t px[8] = {10, 20, 30, 255, 200, 100, 50, 255};
    std::memcpy(bgra.GetData(), px, sizeof(px));

    PixelBuffer out = pigment::CompositeReference({pigment::MakeLayer(bgra)}, kRgba8Srgb);
    const std::uint8_t* a = out.GetTexelBytes(0, 0);
    TEST_CHECK(a[0] == 30 && a[1] == 20 && a[2] == 10 && a[3] == 255);
    const std::uint8_t* b = out.GetTexelBytes(1, 0);
    TEST_CHECK(b[0] == 50 && b[1] == 100 && b[2] == 200 && b[3] == 255);
}

static void test_multiply_screen_over_fold() {
    const glm::vec4 base(0.5f, 0.5f, 0.5f, 1.0f);
    const glm::vec4 tint(0.5f, 1.0f, 0.25f, 1.0f);
    const glm::vec4 glow(0.5f, 0.0f, 0.5f, 1.0f);
    const glm::vec4 veil(1.0f, 1.0f, 1.0f, 1.0f);

    std::vector<Layer> layers;
    layers.push_back(pigment::MakeSolidLayer(kRgba32FLinear, kExtent, base));
    layers.push_back(pigment::MakeSolidLayer(kRgba32FLinear, kExtent, tint, BlendMode::Multiply,
                                             ColorSpace::Linear));
    layers.push_back(pigment::MakeSolidLayer(kRgba32FLinear, kExtent, glow, BlendMode::Screen,
                                             ColorSpace::Linear));
    layers.push_back(pigment::MakeSolidLayer(kRgba32FLinear, kExtent, veil, BlendMode::SourceOver,
                                             ColorSpace::Linear, 0.25f));

    PixelBuffer out = pigment::CompositeReference(layers, kRgba32FLinear);
    // multiply：(0.25, 0.5, 0.125)；screen 0.5/0/0.5：(0.625, 0.5, 0.5625)；
    // 25% 白 source-over：c*0.75 + 0.25
    const glm::vec4 t = out.GetTexel(3, 1);
    TEST_CHECK(std::fabs(t.r - (0.625f * 0.75f + 0.25f)) < 1e-5f);
    TEST_CHECK(std::fabs(t.g - (0.5f * 0.75f + 0.25f)) < 1e-5f);
    TEST_CHECK(std::fabs(t.b - (0.5625f * 0.75f + 0.25f)) < 1e-5f);
    TEST_CHECK(std::fabs(t.a - 1.0f) < 1e-6f);

    // 折叠顺序有意义：交换 multiply 与 screen 得到不同结果
    std::swap(layers[1], layers[2]);
    PixelBuffer swapped = pigment::CompositeReference(layers, kRgba32FLinear);
    TEST_CHECK(std::fabs(swapped.GetTexel(0, 0).r - t.r) > 1e-3f);
}

static void test_transparent_base_keeps_alpha() {
    std::vector<Layer> layers;
    layers.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, glm::vec4(0.0f)));
    layers.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(0, 0, 255, 255),
                                             BlendMode::Difference, ColorSpace::Srgb, 0.5f));
    PixelBuffer out = pigment::CompositeReference(layers, kRgba8Srgb);
    const std::uint8_t* px = out.GetTexelBytes(0, 0);
    TEST_CHECK(px[0] == 0 && px[1] == 0 && px[2] == 255);
    TEST_CHECK(ByteNear(px[3], 128));
}

static void test_placed_layer_and_grey_mask() {
    std::vector<Layer> layers;
    layers.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(255, 0, 0, 255)));
    Layer patch = pigment::MakeSolidLayer(kRgba8Srgb, Extent{2, 1}, Srgb8(0, 0, 255, 255));
    patch.offset = pigment::color::Offset{1, 1};
    layers.push_back(patch);

    PixelBuffer out = pigment::CompositeReference(layers, kRgba8Srgb);
    for (std::uint32_t y = 0; y < kExtent.height; ++y) {
        for (std::uint32_t x = 0; x < kExtent.width; ++x) {
            const std::uint8_t* px = out.GetTexelBytes(x, y);
            const bool covered = y == 1 && (x == 1 || x == 2);
            TEST_CHECK(px[0] == (covered ? 0 : 255));
            TEST_CHECK(px[2] == (covered ? 255 : 0));
            TEST_CHECK(px[3] == 255);
        }
    }

    // R8 灰度 50% 乘到白底上：rgb 同为灰度值，alpha 为 1
    const PixelFormat r8{PixelLayout::R8, ColorSpace::Srgb};
    PixelBuffer mask(r8, 1, 1);
    mask.GetData()[0] = 128;
    std::vector<Layer> masked;
    masked.push_back(pigment::MakeSolidLayer(kRgba8Srgb, kExtent, Srgb8(255, 255, 255, 255)));
    Layer grey = pigment::MakeLayer(mask, BlendMode::Multiply);
    grey.offset = pigment::color::Offset{3, 0};
    masked.push_back(grey);
    PixelBuffer greyOut = pigment::CompositeReference(masked, kRgba8Srgb);
    const std::uint8_t* g = greyOut.GetTexelBytes(3, 0);
    TEST_CHECK(ByteNear(g[0], 128) && ByteNear(g[1], 128) && ByteNear(g[2], 128));
    TEST_CHECK(g[3] == 255);
    TEST_CHECK(greyOut.GetTexelBytes(2, 0)[0] == 255);
}

static void test_reference_errors() {
    TEST_CHECK(ThrowsCode([] { pigment::CompositeReference({}, kRgba8Srgb); },
                          ErrorCode::Validation));

    Layer empty;
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({empty}, kRgba8Srgb); },
                          ErrorCode::Validation));

    Layer a = pigment::MakeSolidLayer(kRgba8Srgb, kExtent, glm::vec4(1.0f));
    Layer badOpacity = a;
    badOpacity.opacity = 1.5f;
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({a, badOpacity}, kRgba8Srgb); },
                          ErrorCode::Validation));
    badOpacity.opacity = std::numeric_limits<float>::quiet_NaN();
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({badOpacity}, kRgba8Srgb); },
                          ErrorCode::Validation));

    Layer other = pigment::MakeSolidLayer(kRgba8Srgb, Extent{3, 3}, glm::vec4(1.0f));
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({a, other}, kRgba8Srgb); },
                          ErrorCode::IncompatibleFormats));

    const PixelFormat r8{PixelLayout::R8, ColorSpace::Srgb};
    Layer mask = pigment::MakeSolidLayer(r8, kExtent, glm::vec4(1.0f));
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({a}, r8); },
                          ErrorCode::IncompatibleFormats));
    Layer shifted = pigment::MakeSolidLayer(kRgba8Srgb, Extent{2, 2}, glm::vec4(1.0f));
    shifted.offset = pigment::color::Offset{3, 0};
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({a, shifted}, kRgba8Srgb); },
                          ErrorCode::IncompatibleFormats));
    TEST_CHECK(ThrowsCode([&] { pigment::CompositeReference({mask}, r8); },
                          ErrorCode::UnsupportedMode));
}

static void test_tolerance_report() {
    PixelBuffer a = PixelBuffer::Solid(kRgba8Srgb, kExtent, glm::vec4(0.5f, 0.5f, 0.5f, 1.0f));
    PixelBuffer b = a;
    pigment::ToleranceReport same = pigment::CompareWithinTolerance(a, b);
    TEST_CHECK(same.WithinTolerance());
    TEST_CHECK(same.maxDelta == 0);
    TEST_CHECK(same.comparedChannels == kExtent.PixelCount() * 4);

    b.GetData()[(1 * kExtent.width + 2) * 4 + 1] += 1;
    pigment::ToleranceReport oneLsb = pigment::CompareWithinTolerance(a, b);
    TEST_CHECK(oneLsb.WithinTolerance());
    TEST_CHECK(oneLsb.maxDelta == 1);

    b.GetData()[(1 * kExtent.width + 3) * 4 + 2] += 5;
    pigment::ToleranceReport off = pigment::CompareWithinTolerance(a, b);
    TEST_CHECK(!off.WithinTolerance());
    TEST_CHECK(off.maxDelta == 5);
    TEST_CHECK(off.mismatchedChannels == 1);
    TEST_CHECK(off.firstMismatchX == 3 && off.firstMismatchY == 1);

    pigment::ToleranceConfig loose;
    loose.maxChannelDelta = 5;
    TEST_CHECK(pigment::CompareWithinTolerance(a, b, loose).WithinTolerance());

    PixelBuffer f = PixelBuffer::Solid(kRgba32FLinear, kExtent, glm::vec4(0.5f));
    PixelBuffer g = PixelBuffer::Solid(kRgba32FLinear, kExtent, glm::vec4(0.5f + 2.0f / 255.0f));
    TEST_CHECK(pigment::CompareWithinTolerance(f, g).maxDelta == 2);

    TEST_CHECK(ThrowsCode([&] { pigment::CompareWithinTolerance(a, f); },
                          ErrorCode::IncompatibleFormats));
}

static void test_tolerance_from_environment() {
    pigment::ToleranceConfig defaults;
    defaults.maxChannelDelta = 1;

    unsetenv("PIGMENT_CHANNEL_TOLERANCE");
    TEST_CHECK(pigment::ToleranceFromEnvironment(defaults).maxChannelDelta == 1);

    setenv("PIGMENT_CHANNEL_TOLERANCE", "3", 1);
    TEST_CHECK(pigment::ToleranceFromEnvironment(defaults).maxChannelDelta == 3);

    setenv("PIGMENT_CHANNEL_TOLERANCE", "abc", 1);
    TEST_CHECK(pigment::ToleranceFromEnvironment(defaults).maxChannelDelta == 1);

    setenv("PIGMENT_CHANNEL_TOLERANCE", "999", 1);
    TEST_CHECK(pigment::ToleranceFromEnvironment(defaults).maxChannelDelta == 1);

    unsetenv("PIGMENT_CHANNEL_TOLERANCE");
}

static void test_error_codes() {
    TEST_CHECK(pigment::IsRecoverable(ErrorCode::OutOfMemory));
    TEST_CHECK(pigment::IsRecoverable(ErrorCode::IncompatibleFormats));
    TEST_CHECK(!pigment::IsRecoverable(ErrorCode::DeviceLost));
    TEST_CHECK(!pigment::IsRecoverable(ErrorCode::StaleHandle));
    Error e(ErrorCode::StaleHandle, "slot 3 released");
    TEST_CHECK(e.code() == ErrorCode::StaleHandle);
    TEST_CHECK(std::string(e.what()) == "StaleHandle: slot 3 released");
}

int main() {
    test_red_under_half_white();
    test_single_layer_identity();
    test_bgra_input_to_rgba_output();
    test_multiply_screen_over_fold();
    test_transparent_base_keeps_alpha();
    test_placed_layer_and_grey_mask();
    test_reference_errors();
    test_tolerance_report();
    test_tolerance_from_environment();
    test_error_codes();

    std::cout << "All direct compositing tests passed." << std::endl;
    return 0;
}
