/**
 * @file test_device_session.cpp
 * @brief DeviceSession 单元测试（MockComputeDevice + 反应线程完成队列）
 *
 * 覆盖：提交 → Await → 回读结果；每个 token 只能 Await 一次；手动完成下的在途计数与延迟回收；
 * 提交失败与录制失败回滚（Fence、命令列表、staging、临时槽均不泄漏）；失效句柄；
 * 宿主回调完成队列在单线程上手动泵送并以 on_ready 续接；未 Await 的 token 不在会话中留存；
 * 设备丢失拒绝全部在途 token 并使句柄失效；并发提交；析构排空。
 */

#include <pigment_core/error.hpp>
#include <pigment_engine/layer.hpp>
#include <pigment_engine/reference_compositor.hpp>
#include <pigment_engine/tolerance.hpp>
#include <pigment_executor/host_callback_completion_queue.hpp>
#include <pigment_executor/reactor_completion_queue.hpp>
#include <pigment_pipeline/blend_planner.hpp>
#include <pigment_pipeline/pipeline_cache.hpp>
#include <pigment_pipeline/shader_loader.hpp>
#include <pigment_resource/resource_arena.hpp>
#include <pigment_session/device_session.hpp>

#include "manual_host.hpp"
#include "mock_compute_device.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
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
using pigment::color::BlendMode;
using pigment::color::Extent;
using pigment::color::kRgba8Srgb;
using pigment::pipeline::BlendDescriptor;
using pigment::pipeline::BlendRequest;
using pigment::pipeline::Plan;
using pigment::resource::PixelBuffer;
using pigment::resource::SlotHandle;
using pigment::session::DeviceSession;
using pigment::session::SessionToken;

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

const Extent kExtent{4, 4};

/** 会话测试夹具：红底 + 半透明白，两层计划（含一个临时槽） */
struct Fixture {
    pigment_test::MockComputeDevice device;
    pigment::resource::ResourceArena arena{&device};
    pigment::pipeline::ShaderLoader loader;
    std::unique_ptr<pigment::pipeline::PipelineCache> cache;
    std::unique_ptr<pigment::pipeline::BlendPlanner> planner;
    std::unique_ptr<DeviceSession> session;

    SlotHandle dest;
    SlotHandle base;
    SlotHandle top;
    std::shared_ptr<const PixelBuffer> basePixels;
    std::shared_ptr<const PixelBuffer> topPixels;

    /** queue 为空时使用反应线程完成队列 */
    explicit Fixture(bool autoComplete = true,
                     std::unique_ptr<pigment::executor::ICompletionQueue> queue = nullptr) {
        device.autoComplete = autoComplete;
        loader.SetBasePath(pigment_test::WriteDummyShader("pigment_test_device_session"));
        cache = std::make_unique<pigment::pipeline::PipelineCache>(&device, &loader);
        planner = std::make_unique<pigment::pipeline::BlendPlanner>(&arena, cache.get());
        if (!queue) queue = std::make_unique<pigment::executor::ReactorCompletionQueue>();
        session = std::make_unique<DeviceSession>(&device, std::move(queue), &arena);
        session->GetStaging().SetPoolSize(4096);

        dest = arena.Allocate(kRgba8Srgb, kExtent);
        base = arena.Allocate(kRgba8Srgb, kExtent);
        top = arena.Allocate(kRgba8Srgb, kExtent);
        basePixels = std::make_shared<const PixelBuffer>(
            PixelBuffer::Solid(kRgba8Srgb, kExtent, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f)));
        topPixels = std::make_shared<const PixelBuffer>(
            PixelBuffer::Solid(kRgba8Srgb, kExtent, glm::vec4(1.0f, 1.0f, 1.0f, 0.5f)));
    }

    ~Fixture() {
        // 会话先于 arena 与设备析构
        session.reset();
    }

    Plan MakePlan(std::shared_ptr<PixelBuffer>& download) {
        BlendRequest request;
        request.stack.push_back(BlendDescriptor{base, dest});
        request.stack.push_back(BlendDescriptor{top, dest});
        request.uploads.push_back({base, basePixels});
        request.uploads.push_back({top, topPixels});
        download = std::make_shared<PixelBuffer>(kRgba8Srgb, kExtent.width, kExtent.height);
        request.download = download;
        return planner->BuildPlan(request);
    }

    PixelBuffer Expected() const {
        std::vector<pigment::Layer> layers;
        layers.push_back(pigment::MakeLayer(*basePixels));
        layers.push_back(pigment::MakeLayer(*topPixels));
        return pigment::CompositeReference(layers, kRgba8Srgb);
    }
};

}  // namespace

static void test_submit_and_await() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;
    std::atomic<int> retired{0};
    SessionToken retiredToken;
    std::mutex tokenMutex;

    const SessionToken token = fx.session->Submit(fx.MakePlan(result), [&](SessionToken t) {
        std::lock_guard lock(tokenMutex);
        retiredToken = t;
        ++retired;
    });
    TEST_CHECK(token.IsValid());

    auto future = fx.session->Await(token);
    future.get();
    fx.session->Drain();
    TEST_CHECK(retired == 1);
    {
        std::lock_guard lock(tokenMutex);
        TEST_CHECK(retiredToken == token);
    }

    TEST_CHECK(pigment::CompareWithinTolerance(*result, fx.Expected()).WithinTolerance());
    TEST_CHECK(fx.device.executionErrors == 0);
    TEST_CHECK(fx.device.dispatches == 2);

    // 提交的全部临时资源已归还
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    const pigment::resource::ArenaStats stats = fx.arena.GetStats();
    TEST_CHECK(stats.liveSlots == 3);
    TEST_CHECK(stats.pendingReleaseSlots == 0);
    TEST_CHECK(stats.pooledSlots == 1);

    // 每个 token 只能 Await 一次
    TEST_CHECK(ThrowsCode([&] { fx.session->Await(token); }, ErrorCode::Validation));
    TEST_CHECK(ThrowsCode([&] { fx.session->Await(SessionToken{9999}); }, ErrorCode::Validation));
}

static void test_manual_completion_and_deferred_release() {
    Fixture fx(false);
    std::shared_ptr<PixelBuffer> result;
    const SessionToken token = fx.session->Submit(fx.MakePlan(result));
    auto future = fx.session->Await(token);

    TEST_CHECK(fx.session->GetInFlightCount() == 1);
    TEST_CHECK(fx.device.GetPendingSubmitCount() == 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    TEST_CHECK(!future.is_ready());

    // 调用方释放在途槽：立即失效，但实际回收等到退役
    fx.arena.Release(fx.top);
    TEST_CHECK(!fx.arena.IsLive(fx.top));
    // 临时槽与 top 都在等待退役
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 2);

    TEST_CHECK(fx.device.CompleteNext());
    future.get();
    fx.session->Drain();
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    TEST_CHECK(fx.arena.GetStats().pooledSlots == 2);
    TEST_CHECK(pigment::CompareWithinTolerance(*result, fx.Expected()).WithinTolerance());
}

static void test_submit_failure_rolls_back() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;

    fx.device.failNextSubmit = true;
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(fx.MakePlan(result)); },
                          ErrorCode::Validation));
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    TEST_CHECK(fx.arena.GetStats().liveSlots == 3);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    // staging 分配全部归还：所有池块完全空闲
    const std::size_t pools = fx.session->GetStaging().GetPoolBufferCount();
    TEST_CHECK(fx.session->GetStaging().Trim() == pools);
    TEST_CHECK(!fx.session->IsLost());

    // 回滚后会话可继续使用
    const SessionToken token = fx.session->Submit(fx.MakePlan(result));
    fx.session->Await(token).get();
    TEST_CHECK(pigment::CompareWithinTolerance(*result, fx.Expected()).WithinTolerance());
}

static void test_transient_out_of_memory_rolls_back() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;
    Plan plan = fx.MakePlan(result);

    // staging（CPU 可见）照常分配，临时槽的设备缓冲分配失败
    fx.device.failOnlyDeviceLocal = true;
    fx.device.failNextBufferAllocations = 1;
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(std::move(plan)); }, ErrorCode::OutOfMemory));
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
    TEST_CHECK(fx.arena.GetStats().liveSlots == 3);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    const std::size_t pools = fx.session->GetStaging().GetPoolBufferCount();
    TEST_CHECK(fx.session->GetStaging().Trim() == pools);
    TEST_CHECK(fx.device.submits == 0);
}

static void test_bind_failure_rolls_back() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;
    Plan plan = fx.MakePlan(result);

    // 录制中途失败：此前的上传拷贝与临时槽都要撤销
    fx.device.failNextBindStorageBuffers = true;
    bool threw = false;
    try {
        fx.session->Submit(std::move(plan));
    } catch (const Error& e) {
        threw = true;
        TEST_CHECK(e.code() == ErrorCode::OutOfMemory);
        TEST_CHECK(std::string(e.what()).find("BindStorageBuffers") != std::string::npos);
        TEST_CHECK(std::string(e.what()).find("descriptor set allocation failed") !=
                   std::string::npos);
    }
    TEST_CHECK(threw);
    TEST_CHECK(fx.device.GetLastFailure().result == pigment_device::DeviceResult::OutOfMemory);
    TEST_CHECK(fx.device.submits == 0);
    TEST_CHECK(fx.device.dispatches == 0);
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    TEST_CHECK(fx.arena.GetStats().liveSlots == 3);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    const std::size_t pools = fx.session->GetStaging().GetPoolBufferCount();
    TEST_CHECK(fx.session->GetStaging().Trim() == pools);
    TEST_CHECK(!fx.session->IsLost());

    // EndCommandList 失败同样以 Error 抛出并回滚
    fx.device.failNextEndCommandList = true;
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(fx.MakePlan(result)); },
                          ErrorCode::Validation));
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);

    const SessionToken token = fx.session->Submit(fx.MakePlan(result));
    fx.session->Await(token).get();
    TEST_CHECK(pigment::CompareWithinTolerance(*result, fx.Expected()).WithinTolerance());
}

static void test_failure_info_read_as_one_value() {
    pigment_test::MockComputeDevice device;
    device.failAllBufferAllocations = true;
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    // 两个线程交替写入不同的失败，读取方看到的结果码与消息必须成对
    std::thread oom([&]() {
        pigment_device::BufferDesc desc;
        desc.size = 64;
        while (!stop) device.CreateBuffer(desc, nullptr);
    });
    std::thread invalid([&]() {
        pigment_device::ShaderDesc desc;
        while (!stop) device.CreateShader(desc);
    });
    for (int i = 0; i < 20000; ++i) {
        const pigment_device::DeviceFailureInfo info = device.GetLastFailure();
        if (info.result == pigment_device::DeviceResult::OutOfMemory &&
            info.message != "mock: out of device memory")
            ++torn;
        if (info.result == pigment_device::DeviceResult::Validation &&
            info.message != "mock: empty shader code")
            ++torn;
    }
    stop = true;
    oom.join();
    invalid.join();
    TEST_CHECK(torn == 0);

    // GetLastError 取自同一份失败记录
    const std::string message = device.GetLastError();
    TEST_CHECK(message == "mock: out of device memory" || message == "mock: empty shader code");
}

static void test_host_callback_queue_single_thread() {
    pigment_test::ManualHost host;
    Fixture fx(true, std::make_unique<pigment::executor::HostCallbackCompletionQueue>(
                         host.Scheduler()));
    std::shared_ptr<PixelBuffer> result;
    int retired = 0;
    const SessionToken token =
        fx.session->Submit(fx.MakePlan(result), [&](SessionToken) { ++retired; });
    auto future = fx.session->Await(token);

    const std::thread::id self = std::this_thread::get_id();
    int calls = 0;
    bool sameThread = false;
    future.on_ready([&]() {
        ++calls;
        sameThread = std::this_thread::get_id() == self;
    });

    // Fence 已完成，但在宿主泵送之前什么都不发生
    TEST_CHECK(calls == 0);
    TEST_CHECK(!future.is_ready());
    TEST_CHECK(fx.session->GetInFlightCount() == 1);
    TEST_CHECK(host.Pending() == 1);

    host.PumpOnce();
    TEST_CHECK(calls == 1);
    TEST_CHECK(sameThread);
    TEST_CHECK(retired == 1);
    TEST_CHECK(future.is_ready());
    future.get();
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
    TEST_CHECK(host.Pending() == 0);
    TEST_CHECK(pigment::CompareWithinTolerance(*result, fx.Expected()).WithinTolerance());

    // 已就绪后登记的回调在登记线程上立即调用
    const SessionToken again = fx.session->Submit(fx.MakePlan(result));
    auto second = fx.session->Await(again);
    host.PumpOnce();
    int late = 0;
    second.on_ready([&]() { ++late; });
    TEST_CHECK(late == 1);
}

static void test_tokens_not_retained_by_session() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;
    // 从不 Await 的提交退役后不留下任何记录
    for (int i = 0; i < 64; ++i) fx.session->Submit(fx.MakePlan(result));
    const SessionToken kept = fx.session->Submit(fx.MakePlan(result));
    fx.session->Drain();
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);

    // 退役后仍可 Await 保留的 token，结果立即就绪
    const SessionToken copy = kept;
    auto future = fx.session->Await(kept);
    TEST_CHECK(future.is_ready());
    future.get();
    // 副本共享完成状态
    TEST_CHECK(ThrowsCode([&] { fx.session->Await(copy); }, ErrorCode::Validation));
    TEST_CHECK(ThrowsCode([&] { fx.session->Await(SessionToken{kept.id}); },
                          ErrorCode::Validation));
    TEST_CHECK(ThrowsCode([&] { fx.session->Await(SessionToken{}); }, ErrorCode::Validation));
}

static void test_empty_and_stale_plans() {
    Fixture fx;
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(Plan{}); }, ErrorCode::Validation));

    std::shared_ptr<PixelBuffer> result;
    Plan plan = fx.MakePlan(result);
    fx.arena.Release(fx.top);
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(std::move(plan)); }, ErrorCode::StaleHandle));
    // 已加的引用全部撤销
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    TEST_CHECK(fx.arena.IsLive(fx.dest));
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
    TEST_CHECK(fx.session->GetInFlightCount() == 0);
}

static void test_device_lost_rejects_pending() {
    Fixture fx(false);
    std::shared_ptr<PixelBuffer> r1;
    std::shared_ptr<PixelBuffer> r2;
    std::shared_ptr<PixelBuffer> r3;
    std::atomic<int> retired{0};
    auto onRetire = [&](SessionToken) { ++retired; };

    const SessionToken t1 = fx.session->Submit(fx.MakePlan(r1), onRetire);
    const SessionToken t2 = fx.session->Submit(fx.MakePlan(r2), onRetire);
    Plan late = fx.MakePlan(r3);
    auto f1 = fx.session->Await(t1);
    auto f2 = fx.session->Await(t2);

    fx.device.SimulateDeviceLost();
    TEST_CHECK(ThrowsCode([&] { f1.get(); }, ErrorCode::DeviceLost));
    TEST_CHECK(ThrowsCode([&] { f2.get(); }, ErrorCode::DeviceLost));
    fx.session->Drain();
    TEST_CHECK(retired == 2);

    TEST_CHECK(fx.session->IsLost());
    TEST_CHECK(fx.arena.IsInvalidated());
    TEST_CHECK(!fx.arena.IsLive(fx.dest));
    TEST_CHECK(ThrowsCode([&] { fx.arena.Resolve(fx.base); }, ErrorCode::StaleHandle));

    // 之后的提交直接拒绝，不重连
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(std::move(late)); }, ErrorCode::DeviceLost));
}

static void test_device_lost_during_submit() {
    Fixture fx;
    std::shared_ptr<PixelBuffer> result;
    fx.device.failNextSubmit = true;
    fx.device.failNextSubmitResult = pigment_device::DeviceResult::DeviceLost;
    TEST_CHECK(ThrowsCode([&] { fx.session->Submit(fx.MakePlan(result)); }, ErrorCode::DeviceLost));
    TEST_CHECK(fx.session->IsLost());
    TEST_CHECK(fx.arena.IsInvalidated());
    TEST_CHECK(fx.device.GetLiveCommandListCount() == 0);
}

static void test_concurrent_submits() {
    Fixture fx;
    std::atomic<int> retired{0};
    std::atomic<int> matched{0};
    const PixelBuffer expected = fx.Expected();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 10; ++i) {
                std::shared_ptr<PixelBuffer> result;
                const SessionToken token =
                    fx.session->Submit(fx.MakePlan(result), [&](SessionToken) { ++retired; });
                fx.session->Await(token).get();
                if (pigment::CompareWithinTolerance(*result, expected).WithinTolerance())
                    ++matched;
            }
        });
    }
    for (auto& th : threads) th.join();
    fx.session->Drain();
    TEST_CHECK(retired == 40);
    TEST_CHECK(matched == 40);
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
    TEST_CHECK(fx.device.GetLiveFenceCount() == 0);
}

static void test_destructor_drains() {
    Fixture fx(false);
    std::shared_ptr<PixelBuffer> result;
    std::atomic<bool> retired{false};
    fx.session->Submit(fx.MakePlan(result), [&](SessionToken) { retired = true; });

    std::thread completer([&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        fx.device.CompleteAll();
    });
    fx.session.reset();
    TEST_CHECK(retired);
    completer.join();
    TEST_CHECK(fx.arena.GetStats().pendingReleaseSlots == 0);
}

int main() {
    test_submit_and_await();
    test_manual_completion_and_deferred_release();
    test_submit_failure_rolls_back();
    test_transient_out_of_memory_rolls_back();
    test_bind_failure_rolls_back();
    test_empty_and_stale_plans();
    test_device_lost_rejects_pending();
    test_device_lost_during_submit();
    test_concurrent_submits();
    test_destructor_drains();
    test_failure_info_read_as_one_value();
    test_host_callback_queue_single_thread();
    test_tokens_not_retained_by_session();

    std::cout << "All DeviceSession tests passed." << std::endl;
    return 0;
}
