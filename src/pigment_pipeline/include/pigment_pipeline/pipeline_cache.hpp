/**
 * @file pipeline_cache.hpp
 * @brief 计算管线缓存：每个 PipelineKey 在缓存生命周期内至多构建一次
 *
 * 键表状态：Ready（已有句柄）或 Building（某个调用方正在构建，其余调用方登记为等待者）。
 * 构建在锁外进行；完成后把结果（句柄或异常）交给所有等待者。
 * 构建失败时条目被移除，之后的调用可以重试。
 * 着色器模块在首次构建时加载一次，之后所有键共享。
 */

#pragma once

#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>
#include <pigment_executor/executor_future.hpp>
#include <pigment_pipeline/pipeline_key.hpp>
#include <pigment_pipeline/shader_loader.hpp>

#include <executor/executor.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pigment::pipeline {

class PipelineCache {
public:
    /**
     * @param device 计算设备，生命周期须长于缓存
     * @param loader 着色器加载器（已设置 basePath），生命周期须长于缓存
     * @param shaderFile 相对 loader basePath 的 SPIR-V 文件
     */
    PipelineCache(pigment_device::IComputeDevice* device, ShaderLoader* loader,
                  std::string shaderFile = kBlendShaderFile);
    ~PipelineCache();

    PipelineCache(const PipelineCache&) = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;

    /**
     * 返回 key 对应的管线，未缓存时构建；并发调用同一未缓存键时只有一个调用方构建。
     * @throws Error(UnsupportedMode) key 未注册
     * @throws Error(Validation) 着色器产物缺失或管线创建被拒绝
     * @throws Error(OutOfMemory) / Error(DeviceLost) 设备失败
     */
    pigment_device::PipelineHandle GetOrBuild(const PipelineKey& key);

    /** 已注册的内核：九种模式 × 三种求值空间 × {Rgba8, Bgra8, Rgba32F} 输出；R8 输出未注册 */
    bool Supports(const PipelineKey& key) const;

    bool IsCached(const PipelineKey& key) const;
    std::size_t GetCachedCount() const;

    /** 调用 CreateComputePipeline 的累计次数（含失败） */
    std::uint64_t GetBuildCount() const { return buildCount_.load(); }

    /**
     * 在 ex 上并发构建 keys；全部完成后 future 就绪，任一失败时携带第一个异常。
     */
    executor::ExecutorFuture<void> PrewarmAsync(::executor::Executor& ex,
                                                const std::vector<PipelineKey>& keys);

    /**
     * 销毁所有 Ready 管线与着色器模块；正在构建的条目不受影响。
     * 着色器模块在进行中的 CreateComputePipeline 全部返回后才销毁。
     */
    void Clear();

    /** 给定输出格式下全部已注册的键，供 PrewarmAsync 使用 */
    static std::vector<PipelineKey> SupportedKeys(const color::PixelFormat& outputFormat);

private:
    struct Entry {
        bool ready = false;
        pigment_device::PipelineHandle handle{};
        std::vector<executor::ExecutorPromise<pigment_device::PipelineHandle>> waiters;
    };

    /** 锁外执行；失败抛出 Error */
    pigment_device::PipelineHandle Build(const PipelineKey& key);
    /** 调用方持有 shaderMutex_ */
    pigment_device::ShaderHandle EnsureShaderLocked();

    pigment_device::IComputeDevice* device_ = nullptr;
    ShaderLoader* loader_ = nullptr;
    std::string shaderFile_;

    mutable std::mutex mutex_;
    std::unordered_map<PipelineKey, Entry, PipelineKeyHash> entries_;

    std::mutex shaderMutex_;
    std::condition_variable shaderIdle_;
    pigment_device::ShaderHandle shader_{};
    /** 正在使用 shader_ 创建管线的构建数 */
    std::size_t activeBuilds_ = 0;

    std::atomic<std::uint64_t> buildCount_{0};
};

}  // namespace pigment::pipeline
