/**
 * @file compositor.cpp
 * @brief Compositor 初始化顺序与合成流程实现
 *
 * 顺序：CreateComputeDevice → Initialize(DeviceConfig) → ResourceArena
 * → ShaderLoader(PIGMENT_SHADER_DIR) → PipelineCache → BlendPlanner → executor
 * → DeviceSession(CreateCompletionQueue)
 */

#include <pigment_engine/compositor.hpp>

#include <pigment_pipeline/blend_planner.hpp>
#include <pigment_pipeline/pipeline_cache.hpp>
#include <pigment_pipeline/shader_loader.hpp>
#include <pigment_session/device_session.hpp>

#include <atomic>
#include <vector>

#ifndef PIGMENT_SHADER_DIR
#define PIGMENT_SHADER_DIR "./shaders"
#endif

namespace pigment {

namespace {

struct CompositorImpl {
    CompositorConfig config;
    std::unique_ptr<pigment_device::IComputeDevice> device;
    std::unique_ptr<resource::ResourceArena> arena;
    pipeline::ShaderLoader loader;
    std::unique_ptr<pipeline::PipelineCache> cache;
    std::unique_ptr<pipeline::BlendPlanner> planner;
    std::unique_ptr<::executor::Executor> executor;
    std::unique_ptr<session::DeviceSession> session;
    std::atomic<std::uint64_t> oomRetries{0};
};

CompositorImpl& ImplOf(void* impl) {
    if (!impl) throw Error(ErrorCode::Validation, "Compositor: not initialized");
    return *static_cast<CompositorImpl*>(impl);
}

}  // namespace

// =============================================================================
// PendingComposite
// =============================================================================

resource::PixelBuffer PendingComposite::Get() {
    if (cancelled_) throw Error(ErrorCode::Validation, "PendingComposite: cancelled");
    if (!done_.valid() || !result_)
        throw Error(ErrorCode::Validation, "PendingComposite: result already taken");
    done_.get();
    std::shared_ptr<resource::PixelBuffer> result = std::move(result_);
    return std::move(*result);
}

void PendingComposite::OnReady(std::function<void(PendingComposite ready)> callback) {
    if (cancelled_) throw Error(ErrorCode::Validation, "PendingComposite: cancelled");
    if (!done_.valid() || !result_)
        throw Error(ErrorCode::Validation, "PendingComposite: result already taken");
    // future 由共享块持有：回调触发前句柄本身可以被移动或销毁
    auto done = std::make_shared<executor::ExecutorFuture<void>>(std::move(done_));
    std::shared_ptr<resource::PixelBuffer> result = std::move(result_);
    done->on_ready([done, result, callback = std::move(callback)]() mutable {
        callback(PendingComposite(std::move(*done), std::move(result)));
    });
}

void PendingComposite::Cancel() {
    // 提交本身继续执行并在退役时释放资源，这里只丢弃对结果的关注
    done_ = executor::ExecutorFuture<void>{};
    result_.reset();
    cancelled_ = true;
}

// =============================================================================
// Compositor
// =============================================================================

Compositor::Compositor(std::unique_ptr<pigment_device::IComputeDevice> device,
                       std::unique_ptr<executor::ICompletionQueue> queue,
                       const CompositorConfig& config) {
    if (!Initialize(config, std::move(device), std::move(queue)))
        throw Error(ErrorCode::Validation, GetLastError());
}

bool Compositor::Initialize(const CompositorConfig& config) {
    std::unique_ptr<pigment_device::IComputeDevice> device =
        pigment_device::CreateComputeDevice(pigment_device::Backend::Vulkan);
    if (!device) {
        SetLastError("CreateComputeDevice failed: no compute backend in this build");
        return false;
    }
    return Initialize(config, std::move(device), executor::CreateCompletionQueue());
}

bool Compositor::Initialize(const CompositorConfig& config,
                            std::unique_ptr<pigment_device::IComputeDevice> device,
                            std::unique_ptr<executor::ICompletionQueue> queue) {
    Shutdown();
    if (!device || !queue) {
        SetLastError("Compositor: device and completion queue are required");
        return false;
    }
    impl_ = new CompositorImpl();
    CompositorImpl& impl = *static_cast<CompositorImpl*>(impl_);
    impl.config = config;

    // 1. 计算设备
    impl.device = std::move(device);
    if (!impl.device->Initialize(config.device)) {
        SetLastError(impl.device->GetLastError());
        Shutdown();
        return false;
    }

    // 2. 槽表
    impl.arena = std::make_unique<resource::ResourceArena>(impl.device.get(), config.arena);

    // 3. 着色器产物必须存在，内核在首次使用时构建
    impl.loader.SetBasePath(config.shaderPath.empty() ? std::string(PIGMENT_SHADER_DIR)
                                                      : config.shaderPath);
    std::vector<std::uint8_t> spirv;
    if (!impl.loader.LoadSPIRV(pipeline::kBlendShaderFile, spirv)) {
        SetLastError(impl.loader.GetLastError());
        Shutdown();
        return false;
    }
    impl.cache = std::make_unique<pipeline::PipelineCache>(impl.device.get(), &impl.loader);

    // 4. 规划器
    impl.planner = std::make_unique<pipeline::BlendPlanner>(impl.arena.get(), impl.cache.get());

    // 5. continuation 与预热使用的 executor
    impl.executor = std::make_unique<::executor::Executor>();
    impl.executor->initialize(::executor::ExecutorConfig{});

    // 6. 会话（启动完成队列）
    try {
        impl.session = std::make_unique<session::DeviceSession>(impl.device.get(),
                                                                std::move(queue),
                                                                impl.arena.get());
    } catch (const Error& e) {
        SetLastError(e.what());
        Shutdown();
        return false;
    }
    impl.session->GetStaging().SetPoolSize(config.stagingPoolSize);
    return true;
}

std::string Compositor::GetLastError() const {
    std::lock_guard lock(errorMutex_);
    return lastError_;
}

void Compositor::SetLastError(const std::string& message) {
    std::lock_guard lock(errorMutex_);
    lastError_ = message;
}

void Compositor::Shutdown() {
    if (!impl_) return;
    CompositorImpl& impl = *static_cast<CompositorImpl*>(impl_);
    // 先排空会话：退役时交给 executor 的续接任务在 executor 关闭前全部入队
    impl.session.reset();
    if (impl.executor) impl.executor->shutdown(true);
    impl.executor.reset();
    impl.planner.reset();
    impl.cache.reset();
    impl.arena.reset();
    if (impl.device) impl.device->Shutdown();
    impl.device.reset();
    delete &impl;
    impl_ = nullptr;
}

PendingComposite Compositor::Composite(const std::vector<Layer>& layers,
                                       const color::PixelFormat& outputFormat) {
    CompositorImpl& impl = ImplOf(impl_);
    if (layers.empty()) throw Error(ErrorCode::Validation, "Compositor: no layers");
    for (std::size_t i = 0; i < layers.size(); ++i) {
        if (!layers[i].pixels || layers[i].pixels->IsEmpty())
            throw Error(ErrorCode::Validation,
                        "Compositor: layer " + std::to_string(i) + " has no pixels");
    }

    try {
        return CompositeOnce(layers, outputFormat);
    } catch (const Error& e) {
        if (e.code() != ErrorCode::OutOfMemory || !impl.config.retryOnOutOfMemory) throw;
    }
    impl.arena->TrimFreePool();
    impl.session->GetStaging().Trim();
    impl.oomRetries.fetch_add(1);
    return CompositeOnce(layers, outputFormat);
}

PendingComposite Compositor::CompositeOnce(const std::vector<Layer>& layers,
                                           const color::PixelFormat& outputFormat) {
    CompositorImpl& impl = ImplOf(impl_);
    const color::Extent extent = layers.front().pixels->GetExtent();

    std::vector<resource::SlotHandle> slots;
    auto releaseSlots = [&]() {
        for (const resource::SlotHandle& h : slots) {
            if (impl.arena->IsLive(h)) impl.arena->Release(h);
        }
        slots.clear();
    };

    try {
        pipeline::BlendRequest request;
        const resource::SlotHandle output = impl.arena->Allocate(outputFormat, extent);
        slots.push_back(output);
        for (const Layer& layer : layers) {
            const resource::SlotHandle h =
                impl.arena->Allocate(layer.pixels->GetFormat(), layer.pixels->GetExtent());
            slots.push_back(h);
            request.stack.push_back(
                pipeline::BlendDescriptor{h, output, layer.mode, layer.space, layer.opacity,
                                          layer.offset});
            request.uploads.push_back(pipeline::UploadRequest{h, layer.pixels});
        }
        auto result =
            std::make_shared<resource::PixelBuffer>(outputFormat, extent.width, extent.height);
        request.download = result;

        pipeline::Plan plan = impl.planner->BuildPlan(request);
        const session::SessionToken token = impl.session->Submit(std::move(plan));
        releaseSlots();
        return PendingComposite(impl.session->Await(token), std::move(result));
    } catch (...) {
        releaseSlots();
        throw;
    }
}

executor::ExecutorFuture<void> Compositor::PrewarmAsync(const color::PixelFormat& outputFormat) {
    CompositorImpl& impl = ImplOf(impl_);
    return impl.cache->PrewarmAsync(*impl.executor,
                                    pipeline::PipelineCache::SupportedKeys(outputFormat));
}

bool Compositor::IsDeviceLost() const {
    if (!impl_) return false;
    const CompositorImpl& impl = *static_cast<const CompositorImpl*>(impl_);
    return impl.session->IsLost() || impl.device->IsDeviceLost();
}

std::uint64_t Compositor::GetOutOfMemoryRetryCount() const {
    if (!impl_) return 0;
    return static_cast<const CompositorImpl*>(impl_)->oomRetries.load();
}

pigment_device::IComputeDevice* Compositor::GetDevice() {
    return impl_ ? static_cast<CompositorImpl*>(impl_)->device.get() : nullptr;
}

resource::ResourceArena* Compositor::GetArena() {
    return impl_ ? static_cast<CompositorImpl*>(impl_)->arena.get() : nullptr;
}

pipeline::PipelineCache* Compositor::GetPipelineCache() {
    return impl_ ? static_cast<CompositorImpl*>(impl_)->cache.get() : nullptr;
}

session::DeviceSession* Compositor::GetSession() {
    return impl_ ? static_cast<CompositorImpl*>(impl_)->session.get() : nullptr;
}

::executor::Executor* Compositor::GetExecutor() {
    return impl_ ? static_cast<CompositorImpl*>(impl_)->executor.get() : nullptr;
}

}  // namespace pigment
