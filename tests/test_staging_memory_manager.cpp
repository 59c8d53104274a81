/**
 * @file test_staging_memory_manager.cpp
 * @brief StagingMemoryManager 单元测试
 *
 * 覆盖：null 设备/零 size Allocate 返回无效；对齐与池内线性分配；Free 合并回收与整块重置；
 * 池块大小配置；设备分配失败返回无效；SubmitUpload/SubmitReadback 录制拷贝并在提交后生效；Trim。
 */

#include <pigment_resource/staging_memory_manager.hpp>

#include "mock_compute_device.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <vector>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

using pigment::resource::StagingAllocation;
using pigment::resource::StagingMemoryManager;
using pigment_test::MockComputeDevice;

static void test_null_device_and_zero_size() {
    StagingMemoryManager nullMgr(nullptr);
    TEST_CHECK(!nullMgr.Allocate(64).IsValid());

    MockComputeDevice device;
    StagingMemoryManager mgr(&device);
    TEST_CHECK(!mgr.Allocate(0).IsValid());
    TEST_CHECK(mgr.GetPoolBufferCount() == 0);
}

static void test_allocate_aligned_and_writable() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);

    StagingAllocation a = mgr.Allocate(100);
    TEST_CHECK(a.IsValid());
    TEST_CHECK(a.size == 256);
    TEST_CHECK(a.offset == 0);
    std::memset(a.mappedPtr, 0xAB, 100);

    StagingAllocation b = mgr.Allocate(300);
    TEST_CHECK(b.IsValid());
    TEST_CHECK(b.buffer == a.buffer);
    TEST_CHECK(b.offset == 256);
    TEST_CHECK(b.size == 512);
    TEST_CHECK(mgr.GetPoolBufferCount() == 1);
    TEST_CHECK(device.bufferCreates == 1);

    mgr.Free(a);
    mgr.Free(b);
}

static void test_free_coalesces_and_reuses() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);

    StagingAllocation a = mgr.Allocate(256);
    StagingAllocation b = mgr.Allocate(256);
    StagingAllocation c = mgr.Allocate(256);
    TEST_CHECK(a.IsValid() && b.IsValid() && c.IsValid());

    // a、b 相邻释放后合并为 512 字节空闲块，可满足一次 512 的请求
    mgr.Free(a);
    mgr.Free(b);
    StagingAllocation d = mgr.Allocate(512);
    TEST_CHECK(d.IsValid());
    TEST_CHECK(d.offset == 0);
    TEST_CHECK(mgr.GetPoolBufferCount() == 1);

    mgr.Free(c);
    mgr.Free(d);

    // 整块空闲后水线重置，下一次从 0 开始
    StagingAllocation e = mgr.Allocate(64);
    TEST_CHECK(e.offset == 0);
    mgr.Free(e);
}

static void test_pool_size_and_oversized_request() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);
    TEST_CHECK(mgr.GetPoolSize() == 16u * 1024u * 1024u);

    mgr.SetPoolSize(1024);
    TEST_CHECK(mgr.GetPoolSize() == 1024);

    StagingAllocation a = mgr.Allocate(1024);
    StagingAllocation b = mgr.Allocate(256);
    TEST_CHECK(a.IsValid() && b.IsValid());
    TEST_CHECK(a.buffer != b.buffer);
    TEST_CHECK(mgr.GetPoolBufferCount() == 2);

    // 超过池块大小的请求得到独立的大块
    StagingAllocation big = mgr.Allocate(4096);
    TEST_CHECK(big.IsValid());
    TEST_CHECK(big.size == 4096);
    TEST_CHECK(mgr.GetPoolBufferCount() == 3);

    mgr.Free(a);
    mgr.Free(b);
    mgr.Free(big);
}

static void test_device_allocation_failure() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);
    device.failNextBufferAllocations = 1;

    StagingAllocation a = mgr.Allocate(128);
    TEST_CHECK(!a.IsValid());
    TEST_CHECK(device.GetLastResult() == pigment_device::DeviceResult::OutOfMemory);
    TEST_CHECK(mgr.GetPoolBufferCount() == 0);

    StagingAllocation b = mgr.Allocate(128);
    TEST_CHECK(b.IsValid());
    mgr.Free(b);
}

static void test_upload_and_readback_copy() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);

    pigment_device::BufferDesc desc;
    desc.size = 64;
    desc.usage = pigment_device::BufferUsage::Storage;
    pigment_device::BufferHandle gpu = device.CreateBuffer(desc, nullptr);
    TEST_CHECK(gpu.IsValid());

    StagingAllocation up = mgr.Allocate(64);
    StagingAllocation down = mgr.Allocate(64);
    TEST_CHECK(up.IsValid() && down.IsValid());
    auto* src = static_cast<std::uint8_t*>(up.mappedPtr);
    for (int i = 0; i < 64; ++i) src[i] = static_cast<std::uint8_t>(i * 3);
    std::memset(down.mappedPtr, 0, 64);

    pigment_device::CommandList* cmd = device.BeginCommandList();
    TEST_CHECK(cmd != nullptr);
    TEST_CHECK(mgr.SubmitUpload(cmd, up, gpu, 64));
    TEST_CHECK(mgr.SubmitReadback(cmd, gpu, 0, down, 64));
    TEST_CHECK(device.EndCommandList(cmd));
    TEST_CHECK(device.copies == 2);

    pigment_device::FenceHandle fence = device.CreateFence(false);
    TEST_CHECK(device.Submit({cmd}, fence));
    TEST_CHECK(device.IsFenceSignaled(fence));

    std::vector<std::uint8_t> gpuBytes = device.ReadBuffer(gpu);
    TEST_CHECK(gpuBytes.size() == 64);
    TEST_CHECK(std::memcmp(gpuBytes.data(), src, 64) == 0);
    TEST_CHECK(std::memcmp(down.mappedPtr, src, 64) == 0);
    TEST_CHECK(device.executionErrors == 0);

    device.ReleaseCommandList(cmd);
    device.DestroyFence(fence);
    device.DestroyBuffer(gpu);
    mgr.Free(up);
    mgr.Free(down);
}

static void test_submit_ignores_invalid_arguments() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);
    StagingAllocation a = mgr.Allocate(64);

    pigment_device::CommandList* cmd = device.BeginCommandList();
    TEST_CHECK(!mgr.SubmitUpload(nullptr, a, pigment_device::BufferHandle{1}, 64));
    TEST_CHECK(!mgr.SubmitUpload(cmd, StagingAllocation{}, pigment_device::BufferHandle{1}, 64));
    TEST_CHECK(!mgr.SubmitUpload(cmd, a, pigment_device::BufferHandle{}, 64));
    TEST_CHECK(!mgr.SubmitReadback(cmd, pigment_device::BufferHandle{1}, 0, a, 0));
    TEST_CHECK(device.copies == 0);
    // 目标缓冲未知：命令列表拒绝拷贝
    TEST_CHECK(!mgr.SubmitUpload(cmd, a, pigment_device::BufferHandle{4242}, 64));
    TEST_CHECK(device.GetLastResult() == pigment_device::DeviceResult::Validation);

    device.ReleaseCommandList(cmd);
    mgr.Free(a);
}

static void test_trim_destroys_idle_pools() {
    MockComputeDevice device;
    StagingMemoryManager mgr(&device);
    mgr.SetPoolSize(512);

    StagingAllocation a = mgr.Allocate(512);
    StagingAllocation b = mgr.Allocate(512);
    TEST_CHECK(mgr.GetPoolBufferCount() == 2);
    TEST_CHECK(device.GetLiveBufferCount() == 2);

    mgr.Free(a);
    TEST_CHECK(mgr.Trim() == 1);
    TEST_CHECK(mgr.GetPoolBufferCount() == 1);
    TEST_CHECK(device.GetLiveBufferCount() == 1);

    // 仍有活跃分配的池块不被销毁
    TEST_CHECK(mgr.Trim() == 0);
    mgr.Free(b);
    TEST_CHECK(mgr.Trim() == 1);
    TEST_CHECK(device.GetLiveBufferCount() == 0);
}

static void test_destructor_releases_pools() {
    MockComputeDevice device;
    {
        StagingMemoryManager mgr(&device);
        StagingAllocation a = mgr.Allocate(32);
        TEST_CHECK(a.IsValid());
        TEST_CHECK(device.GetLiveBufferCount() == 1);
    }
    TEST_CHECK(device.GetLiveBufferCount() == 0);
}

int main() {
    test_null_device_and_zero_size();
    test_allocate_aligned_and_writable();
    test_free_coalesces_and_reuses();
    test_pool_size_and_oversized_request();
    test_device_allocation_failure();
    test_upload_and_readback_copy();
    test_submit_ignores_invalid_arguments();
    test_trim_destroys_idle_pools();
    test_destructor_releases_pools();

    std::cout << "All StagingMemoryManager tests passed." << std::endl;
    return 0;
}
