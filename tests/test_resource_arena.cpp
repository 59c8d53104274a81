/**
 * @file test_resource_arena.cpp
 * @brief ResourceArena 单元测试
 *
 * 覆盖：Release 后 Resolve 报告 StaleHandle；槽复用时 generation 递增、旧句柄不复活；
 * 在途引用下的延迟回收；池化缓冲最佳匹配复用与预算；InvalidateAll 之后拒绝分配；
 * TrimFreePool；设备分配失败映射为 OutOfMemory / DeviceLost；并发分配释放。
 */

#include <pigment_core/error.hpp>
#include <pigment_resource/resource_arena.hpp>

#include "mock_compute_device.hpp"

#include <cstdlib>
#include <iostream>
#include <thread>
#include <unordered_set>
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
using pigment::color::Extent;
using pigment::color::kRgba32FLinear;
using pigment::color::kRgba8Srgb;
using pigment::resource::ArenaConfig;
using pigment::resource::ResourceArena;
using pigment::resource::SlotHandle;
using pigment_test::MockComputeDevice;

namespace {

template <typename F>
bool ThrowsCode(F&& f, ErrorCode code) {
    try {
        f();
    } catch (const Error& e) {
        return e.code() == code;
    }
    return false;
}

}  // namespace

static void test_allocate_resolve_release() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    SlotHandle h = arena.Allocate(kRgba8Srgb, Extent{8, 4});
    TEST_CHECK(h.IsValid());
    TEST_CHECK(arena.IsLive(h));

    pigment::resource::SlotRef ref = arena.Resolve(h);
    TEST_CHECK(ref.buffer.IsValid());
    TEST_CHECK(ref.format == kRgba8Srgb);
    TEST_CHECK(ref.extent == (Extent{8, 4}));
    TEST_CHECK(ref.capacity == 8 * 4 * 4);

    arena.Release(h);
    TEST_CHECK(!arena.IsLive(h));
    TEST_CHECK(ThrowsCode([&] { arena.Resolve(h); }, ErrorCode::StaleHandle));
    TEST_CHECK(ThrowsCode([&] { arena.Release(h); }, ErrorCode::StaleHandle));
    TEST_CHECK(ThrowsCode([&] { arena.AddRef(h); }, ErrorCode::StaleHandle));
    TEST_CHECK(ThrowsCode([&] { arena.Resolve(SlotHandle{}); }, ErrorCode::StaleHandle));
}

static void test_generation_uniqueness_on_reuse() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    std::unordered_set<SlotHandle> seen;
    SlotHandle first = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    seen.insert(first);
    SlotHandle prev = first;
    for (int i = 0; i < 16; ++i) {
        arena.Release(prev);
        SlotHandle next = arena.Allocate(kRgba8Srgb, Extent{4, 4});
        // 同一个槽被复用，但句柄从不重复
        TEST_CHECK(next.index == first.index);
        TEST_CHECK(next.generation != prev.generation);
        TEST_CHECK(seen.insert(next).second);
        TEST_CHECK(!arena.IsLive(prev));
        TEST_CHECK(ThrowsCode([&] { arena.Resolve(prev); }, ErrorCode::StaleHandle));
        prev = next;
    }
    // 池化缓冲被复用，只有一次设备分配
    TEST_CHECK(arena.GetStats().deviceAllocations == 1);
    TEST_CHECK(device.bufferCreates == 1);
    arena.Release(prev);
}

static void test_deferred_release_with_inflight_refs() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    SlotHandle h = arena.Allocate(kRgba8Srgb, Extent{2, 2});
    arena.AddRef(h);
    arena.AddRef(h);
    arena.Release(h);

    // 调用方视角立即失效，但缓冲仍被在途命令持有
    TEST_CHECK(!arena.IsLive(h));
    TEST_CHECK(arena.GetStats().pendingReleaseSlots == 1);
    TEST_CHECK(arena.GetStats().pooledSlots == 0);

    // 待回收期间同一槽不会被再次发放
    SlotHandle other = arena.Allocate(kRgba8Srgb, Extent{2, 2});
    TEST_CHECK(other.index != h.index);

    arena.Unref(h);
    TEST_CHECK(arena.GetStats().pendingReleaseSlots == 1);
    arena.Unref(h);
    TEST_CHECK(arena.GetStats().pendingReleaseSlots == 0);
    TEST_CHECK(arena.GetStats().pooledSlots == 1);

    // 多余的 Unref 对已回收槽无效
    arena.Unref(h);
    TEST_CHECK(arena.GetStats().pooledSlots == 1);
    arena.Release(other);
}

static void test_live_slot_refcount_without_release() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    SlotHandle h = arena.Allocate(kRgba8Srgb, Extent{2, 2});
    arena.AddRef(h);
    arena.Unref(h);
    // 在途计数归零但未 Release：仍为 Live
    TEST_CHECK(arena.IsLive(h));
    arena.Release(h);
    TEST_CHECK(arena.GetStats().pooledSlots == 1);
}

static void test_pool_best_fit_and_budget() {
    MockComputeDevice device;
    ArenaConfig config;
    config.maxPooledBytes = 4096;
    ResourceArena arena(&device, config);

    SlotHandle small = arena.Allocate(kRgba8Srgb, Extent{8, 8});       // 256 B
    SlotHandle large = arena.Allocate(kRgba8Srgb, Extent{16, 16});     // 1024 B
    arena.Release(large);
    arena.Release(small);
    TEST_CHECK(arena.GetStats().pooledBytes == 256 + 1024);

    // 需要 256 B：复用最小的足够缓冲（small 的槽）
    SlotHandle reuse = arena.Allocate(kRgba8Srgb, Extent{4, 16});
    TEST_CHECK(reuse.index == small.index);
    TEST_CHECK(arena.Resolve(reuse).capacity == 256);
    TEST_CHECK(arena.GetStats().deviceAllocations == 2);

    // 超过预算的回收缓冲直接销毁
    SlotHandle huge = arena.Allocate(kRgba32FLinear, Extent{32, 32});  // 16384 B
    TEST_CHECK(arena.GetStats().deviceAllocations == 3);
    const std::size_t liveBefore = device.GetLiveBufferCount();
    arena.Release(huge);
    TEST_CHECK(device.GetLiveBufferCount() == liveBefore - 1);
    TEST_CHECK(arena.GetStats().pooledBytes == 1024);

    arena.Release(reuse);
}

static void test_invalidate_all() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    SlotHandle a = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    SlotHandle b = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    arena.AddRef(b);
    arena.Release(b);

    arena.InvalidateAll();
    TEST_CHECK(arena.IsInvalidated());
    TEST_CHECK(!arena.IsLive(a));
    TEST_CHECK(ThrowsCode([&] { arena.Resolve(a); }, ErrorCode::StaleHandle));
    TEST_CHECK(ThrowsCode([&] { arena.Release(a); }, ErrorCode::StaleHandle));
    TEST_CHECK(device.GetLiveBufferCount() == 0);

    // 完成回调中迟到的 Unref 被忽略
    arena.Unref(b);
    TEST_CHECK(arena.GetStats().liveSlots == 0);
    TEST_CHECK(arena.GetStats().pendingReleaseSlots == 0);

    TEST_CHECK(ThrowsCode([&] { arena.Allocate(kRgba8Srgb, Extent{4, 4}); },
                          ErrorCode::DeviceLost));
}

static void test_allocate_refused_when_device_lost() {
    MockComputeDevice device;
    ResourceArena arena(&device);
    device.SimulateDeviceLost();
    TEST_CHECK(ThrowsCode([&] { arena.Allocate(kRgba8Srgb, Extent{4, 4}); },
                          ErrorCode::DeviceLost));
}

static void test_device_allocation_failure_is_out_of_memory() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    device.failNextBufferAllocations = 1;
    TEST_CHECK(ThrowsCode([&] { arena.Allocate(kRgba8Srgb, Extent{64, 64}); },
                          ErrorCode::OutOfMemory));
    TEST_CHECK(arena.GetStats().liveSlots == 0);

    SlotHandle h = arena.Allocate(kRgba8Srgb, Extent{64, 64});
    TEST_CHECK(arena.IsLive(h));
    arena.Release(h);

    TEST_CHECK(ThrowsCode([&] { arena.Allocate(kRgba8Srgb, Extent{0, 4}); },
                          ErrorCode::Validation));
}

static void test_trim_free_pool() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    SlotHandle a = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    SlotHandle b = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    SlotHandle c = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    arena.Release(a);
    arena.Release(b);
    TEST_CHECK(arena.GetStats().pooledSlots == 2);

    TEST_CHECK(arena.TrimFreePool() == 2);
    TEST_CHECK(arena.GetStats().pooledSlots == 0);
    TEST_CHECK(arena.GetStats().pooledBytes == 0);
    TEST_CHECK(device.GetLiveBufferCount() == 1);
    TEST_CHECK(arena.IsLive(c));

    // 裁剪后的空槽仍可复用，但需要新的设备分配
    SlotHandle d = arena.Allocate(kRgba8Srgb, Extent{4, 4});
    TEST_CHECK(d.index == a.index || d.index == b.index);
    TEST_CHECK(arena.GetStats().deviceAllocations == 4);
    arena.Release(c);
    arena.Release(d);
}

static void test_required_bytes_rounding() {
    const pigment::color::PixelFormat r8{pigment::color::PixelLayout::R8,
                                         pigment::color::ColorSpace::Linear};
    TEST_CHECK(ResourceArena::RequiredBytes(r8, Extent{3, 1}) == 4);
    TEST_CHECK(ResourceArena::RequiredBytes(r8, Extent{4, 2}) == 8);
    TEST_CHECK(ResourceArena::RequiredBytes(kRgba32FLinear, Extent{2, 2}) == 64);
}

static void test_concurrent_allocate_release() {
    MockComputeDevice device;
    ResourceArena arena(&device);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&arena]() {
            for (int i = 0; i < 200; ++i) {
                SlotHandle h = arena.Allocate(kRgba8Srgb, Extent{4, 4});
                arena.AddRef(h);
                arena.Release(h);
                arena.Unref(h);
            }
        });
    }
    for (auto& t : threads) t.join();

    pigment::resource::ArenaStats stats = arena.GetStats();
    TEST_CHECK(stats.liveSlots == 0);
    TEST_CHECK(stats.pendingReleaseSlots == 0);
    TEST_CHECK(stats.deviceAllocations <= 4);
}

int main() {
    test_allocate_resolve_release();
    test_generation_uniqueness_on_reuse();
    test_deferred_release_with_inflight_refs();
    test_live_slot_refcount_without_release();
    test_pool_best_fit_and_budget();
    test_invalidate_all();
    test_allocate_refused_when_device_lost();
    test_device_allocation_failure_is_out_of_memory();
    test_trim_free_pool();
    test_required_bytes_rounding();
    test_concurrent_allocate_release();

    std::cout << "All ResourceArena tests passed." << std::endl;
    return 0;
}
