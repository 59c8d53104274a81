/**
 * @file vulkan_compute_device.hpp
 * @brief Vulkan 后端 IComputeDevice 实现
 *
 * 资源表受 mutex_ 保护：完成队列线程会在回收时销毁缓冲、查询 Fence。
 * 每次 BeginCommandList 分配独立的 VkCommandBuffer 与描述符池，
 * 允许多个提交同时在途，Fence signal 后由 ReleaseCommandList 归还。
 */

#pragma once

#include <pigment_device/command_list.hpp>
#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>
#include <pigment_device/vulkan_context.hpp>
#include <pigment_device/vulkan_rdi_utils.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pigment_device {

class VulkanComputeDevice;

/** Vulkan 实现的 CommandList，封装 VkCommandBuffer 与其私有描述符池 */
class VulkanCommandList : public CommandList {
public:
    friend class VulkanComputeDevice;
    VulkanCommandList(VulkanComputeDevice* device, VkCommandBuffer buffer);
    ~VulkanCommandList() override = default;

    VkCommandBuffer GetCommandBuffer() const { return commandBuffer_; }

    bool BindPipeline(PipelineHandle pipeline) override;
    bool BindStorageBuffers(const std::vector<BufferHandle>& buffers) override;
    bool SetPushConstants(const void* data, std::size_t size,
                          std::size_t offset = 0) override;
    void Dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                  std::uint32_t groupCountZ) override;
    bool CopyBufferToBuffer(BufferHandle srcBuffer, std::size_t srcOffset,
                            BufferHandle dstBuffer, std::size_t dstOffset,
                            std::size_t size) override;
    void Barrier(const std::vector<BufferHandle>& buffers) override;
    void HostReadBarrier() override;

private:
    VkDescriptorSet AllocateDescriptorSet(VkDescriptorSetLayout layout);
    /** 记录录制参数错误（Validation），返回 false */
    bool Reject(const std::string& message);

    VulkanComputeDevice* device_ = nullptr;
    VkCommandBuffer commandBuffer_ = VK_NULL_HANDLE;
    VulkanPipelineRes currentPipeline_{};
    std::vector<VkDescriptorPool> descriptorPools_;
};

/** Vulkan 后端计算设备 */
class VulkanComputeDevice : public IComputeDevice {
public:
    VulkanComputeDevice() = default;
    ~VulkanComputeDevice() override;

    VulkanComputeDevice(const VulkanComputeDevice&) = delete;
    VulkanComputeDevice& operator=(const VulkanComputeDevice&) = delete;

    bool Initialize(const DeviceConfig& config) override;
    void Shutdown() override;
    std::string GetLastError() const override;
    DeviceResult GetLastResult() const override;
    DeviceFailureInfo GetLastFailure() const override;
    bool IsDeviceLost() const override;

    BufferHandle CreateBuffer(const BufferDesc& desc, const void* data = nullptr) override;
    ShaderHandle CreateShader(const ShaderDesc& desc) override;
    PipelineHandle CreateComputePipeline(const ComputePipelineDesc& desc) override;

    void DestroyBuffer(BufferHandle handle) override;
    void DestroyShader(ShaderHandle handle) override;
    void DestroyPipeline(PipelineHandle handle) override;

    void* MapBuffer(BufferHandle handle, std::size_t offset, std::size_t size) override;
    void UnmapBuffer(BufferHandle handle) override;

    CommandList* BeginCommandList() override;
    bool EndCommandList(CommandList* cmd) override;
    void ReleaseCommandList(CommandList* cmd) override;
    bool Submit(const std::vector<CommandList*>& cmdLists, FenceHandle fence) override;

    void WaitIdle() override;
    FenceHandle CreateFence(bool signaled = false) override;
    void DestroyFence(FenceHandle fence) override;
    FenceStatus GetFenceStatus(FenceHandle fence) const override;
    FenceStatus WaitForAnyFence(const std::vector<FenceHandle>& fences,
                                std::uint64_t timeoutNs) override;

    const DeviceCapabilities& GetCapabilities() const override;

    /// 仅供内部/测试：获取底层 Vulkan 上下文
    VulkanContext* GetContext() { return &context_; }
    const VulkanContext* GetContext() const { return &context_; }

private:
    friend class VulkanCommandList;

    bool CreateVmaOrAllocBuffer(const BufferDesc& desc, VkBuffer* outBuffer,
                                VkDeviceMemory* outMemory, void** outVmaAllocation);
    uint32_t FindMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags props);
    void DestroyBufferLocked(std::uint64_t id);
    /** 记录失败；DEVICE_LOST 时置位 deviceLost_ */
    void RecordFailure(VkResult result, const std::string& message);
    bool LookupBuffer(BufferHandle handle, VulkanBufferRes* out) const;
    bool LookupPipeline(PipelineHandle handle, VulkanPipelineRes* out) const;

    VulkanContext context_;
    DeviceCapabilities capabilities_{};

    mutable std::mutex mutex_;
    std::string lastError_;
    DeviceResult lastResult_ = DeviceResult::Success;
    mutable std::atomic<bool> deviceLost_{false};

    // 资源表
    std::unordered_map<std::uint64_t, VulkanBufferRes> buffers_;
    std::unordered_map<std::uint64_t, void*> bufferAllocations_;  // VmaAllocation（启用 VMA 时）
    std::unordered_map<std::uint64_t, VulkanShaderRes> shaders_;
    std::unordered_map<std::uint64_t, VulkanPipelineRes> pipelines_;
    std::unordered_map<std::uint64_t, VkFence> fences_;
    std::uint64_t nextBufferId_ = 1;
    std::uint64_t nextShaderId_ = 1;
    std::uint64_t nextPipelineId_ = 1;
    std::uint64_t nextFenceId_ = 1;

    // 命令录制
    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    std::unordered_map<CommandList*, std::unique_ptr<VulkanCommandList>> commandLists_;

    void* vmaAllocator_ = nullptr;  // VmaAllocator（启用 VMA 时）
};

}  // namespace pigment_device
