/**
 * @file compute_device.hpp
 * @brief IComputeDevice 计算设备抽象接口与工厂
 *
 * 设备抽象层核心：缓冲/着色器/计算管线创建、命令录制、Fence 同步。
 * 无窗口、无交换链；合成引擎只需要一条计算队列。
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <pigment_device/command_list.hpp>
#include <pigment_device/rdi_types.hpp>

namespace pigment_device {

// =============================================================================
// 设备配置与能力
// =============================================================================

/** 计算设备初始化配置 */
struct DeviceConfig {
    bool enableValidation = false;
    /** 多个物理设备时优先选择的索引；越界时回退到第一个带计算队列的设备 */
    std::uint32_t preferredDeviceIndex = 0;
};

/** 设备能力查询结果 */
struct DeviceCapabilities {
    std::uint32_t maxComputeWorkGroupSize[3] = {0, 0, 0};
    std::uint32_t maxComputeWorkGroupCount[3] = {0, 0, 0};
    std::uint64_t maxStorageBufferRange = 0;
    std::uint32_t maxPushConstantsSize = 0;
    std::string deviceName;
};

/** 计算后端枚举 */
enum class Backend {
    Vulkan,
};

// =============================================================================
// 计算设备接口
// =============================================================================

/** 最近一次失败：分类与原因在同一次加锁中读出 */
struct DeviceFailureInfo {
    DeviceResult result = DeviceResult::Success;
    std::string message;
};

/**
 * 计算设备抽象接口：资源、命令、同步。
 * 资源创建/销毁与 Fence 查询可能来自完成队列线程，实现需保护内部资源表；
 * Submit 由 DeviceSession 串行调用。
 * 创建类调用失败时返回无效句柄，录制类调用失败时返回 false，
 * GetLastFailure() 给出原因与分类。
 */
class IComputeDevice {
public:
    virtual ~IComputeDevice() = default;

    // --- 设备管理 ---
    virtual bool Initialize(const DeviceConfig& config) = 0;
    virtual void Shutdown() = 0;

    /** 最近一次失败的详细错误信息 */
    virtual std::string GetLastError() const = 0;
    /** 最近一次失败的分类 */
    virtual DeviceResult GetLastResult() const = 0;
    virtual DeviceFailureInfo GetLastFailure() const = 0;
    /** 设备是否已丢失（任何调用返回 VK_ERROR_DEVICE_LOST 后为 true，不可恢复） */
    virtual bool IsDeviceLost() const = 0;

    // --- 资源创建 ---
    virtual BufferHandle CreateBuffer(const BufferDesc& desc, const void* data = nullptr) = 0;
    virtual ShaderHandle CreateShader(const ShaderDesc& desc) = 0;
    virtual PipelineHandle CreateComputePipeline(const ComputePipelineDesc& desc) = 0;

    // --- 资源销毁（无效句柄为 no-op）---
    virtual void DestroyBuffer(BufferHandle handle) = 0;
    virtual void DestroyShader(ShaderHandle handle) = 0;
    virtual void DestroyPipeline(PipelineHandle handle) = 0;

    // --- 资源更新 ---
    /** 映射 CPU 可见 Buffer 的指定范围，返回可写指针；非 CPU 可见返回 nullptr */
    virtual void* MapBuffer(BufferHandle handle, std::size_t offset, std::size_t size) = 0;
    virtual void UnmapBuffer(BufferHandle handle) = 0;

    // --- 命令录制 ---
    virtual CommandList* BeginCommandList() = 0;
    /** 结束录制；失败返回 false，命令列表不可提交但仍须 ReleaseCommandList */
    virtual bool EndCommandList(CommandList* cmd) = 0;
    /** 提交的 Fence signal 后归还命令列表（含其描述符池） */
    virtual void ReleaseCommandList(CommandList* cmd) = 0;
    /** 提交到计算队列；失败返回 false 并设置 GetLastResult() */
    virtual bool Submit(const std::vector<CommandList*>& cmdLists, FenceHandle fence) = 0;

    // --- 同步 ---
    virtual void WaitIdle() = 0;
    virtual FenceHandle CreateFence(bool signaled = false) = 0;
    virtual void DestroyFence(FenceHandle fence) = 0;
    /** 非阻塞查询 Fence 状态 */
    virtual FenceStatus GetFenceStatus(FenceHandle fence) const = 0;
    /**
     * 阻塞至 fences 中任意一个 signal、超时或设备丢失。
     * @return Signaled（至少一个完成）、NotReady（超时）或 DeviceLost
     */
    virtual FenceStatus WaitForAnyFence(const std::vector<FenceHandle>& fences,
                                        std::uint64_t timeoutNs) = 0;

    bool IsFenceSignaled(FenceHandle fence) const {
        return GetFenceStatus(fence) == FenceStatus::Signaled;
    }

    // --- 查询 ---
    virtual const DeviceCapabilities& GetCapabilities() const = 0;
};

// =============================================================================
// 工厂
// =============================================================================

/** 根据后端创建计算设备实例（未 Initialize） */
std::unique_ptr<IComputeDevice> CreateComputeDevice(Backend backend);

}  // namespace pigment_device
