/**
 * @file vulkan_rdi_utils.cpp
 * @brief RDI -> Vulkan 转换实现
 */

#include <pigment_device/vulkan_rdi_utils.hpp>

namespace pigment_device {

VkBufferUsageFlags ToVkBufferUsage(BufferUsage u) {
    VkBufferUsageFlags f = 0;
    if (HasBufferUsage(u, BufferUsage::Storage)) f |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    if (HasBufferUsage(u, BufferUsage::Transfer)) f |= VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return f;
}

VkShaderStageFlagBits ToVkShaderStage(ShaderStage s) {
    switch (s) {
        case ShaderStage::Compute: return VK_SHADER_STAGE_COMPUTE_BIT;
        default: return VK_SHADER_STAGE_COMPUTE_BIT;
    }
}

DeviceResult ToDeviceResult(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return DeviceResult::Success;
        case VK_ERROR_OUT_OF_HOST_MEMORY:
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
        case VK_ERROR_OUT_OF_POOL_MEMORY:
        case VK_ERROR_FRAGMENTED_POOL:
        case VK_ERROR_TOO_MANY_OBJECTS: return DeviceResult::OutOfMemory;
        case VK_ERROR_DEVICE_LOST: return DeviceResult::DeviceLost;
        default: return DeviceResult::Validation;
    }
}

FenceStatus ToFenceStatus(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return FenceStatus::Signaled;
        case VK_ERROR_DEVICE_LOST: return FenceStatus::DeviceLost;
        default: return FenceStatus::NotReady;
    }
}

}  // namespace pigment_device
