/**
 * @file vulkan_rdi_utils.hpp
 * @brief RDI 类型到 Vulkan 的转换、VkResult 分类与资源存储结构
 */

#pragma once

#include <pigment_device/rdi_types.hpp>
#include <vulkan/vulkan.h>

#include <cstdint>

namespace pigment_device {

// --- Usage / Stage 转换 ---
VkBufferUsageFlags ToVkBufferUsage(BufferUsage u);
VkShaderStageFlagBits ToVkShaderStage(ShaderStage s);

/** VkResult → DeviceResult：内存不足类归为 OutOfMemory，DEVICE_LOST 归为 DeviceLost，其余失败归为 Validation */
DeviceResult ToDeviceResult(VkResult result);

/** VkResult → FenceStatus（vkGetFenceStatus / vkWaitForFences 的返回值） */
FenceStatus ToFenceStatus(VkResult result);

// --- 资源存储（Vulkan 句柄与元数据）---
struct VulkanBufferRes {
    VkBuffer buffer = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize size = 0;
    bool cpuVisible = false;
    void* mappedPtr = nullptr;  // 持久映射（仅 cpuVisible 时有效）
};

struct VulkanShaderRes {
    VkShaderModule module = VK_NULL_HANDLE;
    ShaderStage stage = ShaderStage::Compute;
};

struct VulkanPipelineRes {
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
    VkDescriptorSetLayout setLayout = VK_NULL_HANDLE;
    std::uint32_t storageBufferCount = 0;
    std::uint32_t pushConstantSize = 0;
};

}  // namespace pigment_device
