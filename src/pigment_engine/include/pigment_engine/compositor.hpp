/**
 * @file compositor.hpp
 * @brief Compositor 合成引擎主入口：初始化顺序、子系统聚合、图层合成
 *
 * 初始化顺序：CreateComputeDevice → ResourceArena → ShaderLoader/PipelineCache
 * → BlendPlanner → executor → DeviceSession(CreateCompletionQueue)。
 * Shutdown 逆序释放：会话先排空在途提交，再销毁管线、槽与设备。
 */

#pragma once

#include <pigment_color/pixel_format.hpp>
#include <pigment_core/error.hpp>
#include <pigment_device/compute_device.hpp>
#include <pigment_engine/layer.hpp>
#include <pigment_executor/completion_queue.hpp>
#include <pigment_executor/executor_future.hpp>
#include <pigment_resource/pixel_buffer.hpp>
#include <pigment_resource/resource_arena.hpp>

#include <executor/executor.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pigment::pipeline {
class PipelineCache;
}  // namespace pigment::pipeline

namespace pigment::session {
class DeviceSession;
}  // namespace pigment::session

namespace pigment {

struct CompositorConfig {
    pigment_device::DeviceConfig device;
    resource::ArenaConfig arena;
    /** blend.comp.spv 所在目录；为空时使用构建期的 PIGMENT_SHADER_DIR */
    std::string shaderPath;
    std::size_t stagingPoolSize = 16 * 1024 * 1024;
    /** 槽分配或提交报告 OutOfMemory 时裁剪空闲池并重试一次 */
    bool retryOnOutOfMemory = true;
};

/**
 * 一次合成的结果句柄。等待方式二选一：
 * - Get() 在调用线程上阻塞，适用于有独立完成线程的原生构建；
 * - OnReady() 登记回调，由完成队列在提交退役时调用，不阻塞任何线程。
 *   宿主事件循环驱动完成检查时只能用这种方式，在事件循环上调用 Get() 会永远等待。
 * Cancel() 只放弃结果，提交仍会正常排空并释放其槽。
 */
class PendingComposite {
public:
    PendingComposite() = default;

    PendingComposite(PendingComposite&&) noexcept = default;
    PendingComposite& operator=(PendingComposite&&) noexcept = default;
    PendingComposite(const PendingComposite&) = delete;
    PendingComposite& operator=(const PendingComposite&) = delete;

    /**
     * 等待完成并取出结果。
     * @throws Error(Validation) 已 Cancel 或结果已取出
     * @throws Error 提交失败时的原错误（如 DeviceLost）
     */
    resource::PixelBuffer Get();

    /**
     * 提交退役时以已就绪的句柄调用 callback，回调内 Get() 立即返回结果或抛出原错误。
     * 回调运行在完成队列的执行上下文中（反应线程或宿主回调）；已就绪时在当前线程立即调用。
     * 本句柄随之交出结果，之后不可再 Get。
     * @throws Error(Validation) 已 Cancel 或结果已取出
     */
    void OnReady(std::function<void(PendingComposite ready)> callback);

    /** 完成后在 ex 上以结果调用 func；之后不可再 Get */
    template <typename F>
    executor::ExecutorFuture<std::invoke_result_t<F, resource::PixelBuffer>> Then(
        ::executor::Executor& ex, F&& func) {
        if (cancelled_ || !done_.valid())
            throw Error(ErrorCode::Validation, "PendingComposite: no result to continue");
        std::shared_ptr<resource::PixelBuffer> result = std::move(result_);
        return done_.then(ex, [result, func = std::forward<F>(func)]() mutable {
            return std::invoke(func, std::move(*result));
        });
    }

    void Cancel();

    bool IsCancelled() const { return cancelled_; }
    /** 提交已退役（成功或失败） */
    bool IsReady() const { return done_.valid() && done_.is_ready(); }

private:
    friend class Compositor;

    PendingComposite(executor::ExecutorFuture<void> done,
                     std::shared_ptr<resource::PixelBuffer> result)
        : done_(std::move(done)), result_(std::move(result)) {}

    executor::ExecutorFuture<void> done_;
    std::shared_ptr<resource::PixelBuffer> result_;
    bool cancelled_ = false;
};

/**
 * 合成引擎：把有序图层栈合成为一幅输出缓冲。
 * Initialize() 失败时返回 false，GetLastError() 返回原因；
 * Composite 的错误以 pigment::Error 抛出或经 PendingComposite 传递。
 */
class Compositor {
public:
    Compositor() = default;
    /** 注入设备与完成队列并初始化；失败抛出 Error(Validation)，消息同 GetLastError() */
    Compositor(std::unique_ptr<pigment_device::IComputeDevice> device,
               std::unique_ptr<executor::ICompletionQueue> queue,
               const CompositorConfig& config = CompositorConfig{});
    ~Compositor() { Shutdown(); }

    Compositor(const Compositor&) = delete;
    Compositor& operator=(const Compositor&) = delete;

    /** 创建 Vulkan 设备与平台完成队列并初始化各子系统 */
    bool Initialize(const CompositorConfig& config);

    /** 使用调用方提供的设备（未 Initialize）与完成队列（未 Start） */
    bool Initialize(const CompositorConfig& config,
                    std::unique_ptr<pigment_device::IComputeDevice> device,
                    std::unique_ptr<executor::ICompletionQueue> queue);

    std::string GetLastError() const;

    /** 排空在途合成后逆序释放所有子系统；可重复调用 */
    void Shutdown();

    bool IsInitialized() const { return impl_ != nullptr; }

    /**
     * 上传各图层、规划、提交，立即释放本次用到的槽（在途引用保证执行期间不被回收）。
     * 图层 0 为底层；画布即输出尺寸，取图层 0 的尺寸。
     * 每个图层按 offset 放置，须完全落在画布内，否则 Error(IncompatibleFormats)。
     * @throws Error(Validation) 未初始化、无图层或图层无像素
     * @throws Error 规划或提交的错误原样抛出
     */
    PendingComposite Composite(const std::vector<Layer>& layers,
                               const color::PixelFormat& outputFormat);

    /** 在 executor 上预构建给定输出格式的全部内核 */
    executor::ExecutorFuture<void> PrewarmAsync(const color::PixelFormat& outputFormat);

    bool IsDeviceLost() const;
    /** 因 OutOfMemory 触发的重试次数 */
    std::uint64_t GetOutOfMemoryRetryCount() const;

    pigment_device::IComputeDevice* GetDevice();
    resource::ResourceArena* GetArena();
    pipeline::PipelineCache* GetPipelineCache();
    session::DeviceSession* GetSession();
    ::executor::Executor* GetExecutor();

private:
    PendingComposite CompositeOnce(const std::vector<Layer>& layers,
                                   const color::PixelFormat& outputFormat);
    void SetLastError(const std::string& message);

    mutable std::mutex errorMutex_;
    std::string lastError_;
    void* impl_ = nullptr;  // 实际为 CompositorImpl*，在 .cpp 中分配/释放
};

}  // namespace pigment
