// Pigment 设备抽象层 - Vulkan 基础上下文
// Instance、Physical Device、Logical Device、计算队列（无 Surface / Swapchain）

#pragma once

#include <cstdint>
#include <string>

// 前向声明 Vulkan 类型，避免在头文件中包含 vulkan.h
typedef struct VkInstance_T* VkInstance;
typedef struct VkPhysicalDevice_T* VkPhysicalDevice;
typedef struct VkDevice_T* VkDevice;
typedef struct VkQueue_T* VkQueue;

namespace pigment_device {

/// Vulkan 上下文配置（与 DeviceConfig 对齐）
struct VulkanConfig {
    bool enableValidation = false;
    uint32_t preferredDeviceIndex = 0;
};

/// Vulkan 基础上下文：Instance、Device 与一条计算队列
/// 不包含 Command Pool、Pipeline、资源表（由 VulkanComputeDevice 管理）
class VulkanContext {
public:
    VulkanContext() = default;
    ~VulkanContext();

    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    /// 创建 Vulkan Instance、选择带计算队列的 Physical Device、创建 Logical Device。
    /// \return 成功返回 true，失败返回 false，可调用 GetLastError()
    bool Initialize(const VulkanConfig& config);

    /// 按创建逆序销毁 Device、Instance
    void Shutdown();

    /// 初始化失败时的详细错误信息
    const std::string& GetLastError() const { return lastError_; }

    // --- 访问器（仅在 Initialize 成功后有效）---

    VkInstance GetInstance() const { return instance_; }
    VkPhysicalDevice GetPhysicalDevice() const { return physicalDevice_; }
    VkDevice GetDevice() const { return device_; }

    /// 计算队列（优先选择仅计算的队列族，否则使用带计算能力的图形队列族）
    VkQueue GetComputeQueue() const { return computeQueue_; }
    uint32_t GetComputeQueueFamilyIndex() const { return computeQueueFamilyIndex_; }

    /// 是否已成功初始化
    bool IsInitialized() const { return device_ != nullptr; }

private:
    bool CreateInstance(const VulkanConfig& config);
    bool SelectPhysicalDevice(const VulkanConfig& config);
    bool CreateLogicalDevice();

    VkInstance instance_ = nullptr;
    VkPhysicalDevice physicalDevice_ = nullptr;
    VkDevice device_ = nullptr;
    VkQueue computeQueue_ = nullptr;
    uint32_t computeQueueFamilyIndex_ = 0;

    std::string lastError_;
    bool validationEnabled_ = false;
};

}  // namespace pigment_device
