// Pigment 设备抽象层 - Vulkan 基础上下文实现

#include <pigment_device/vulkan_context.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <cstring>
#include <vector>

namespace pigment_device {

namespace {

constexpr const char* kValidationLayerName = "VK_LAYER_KHRONOS_validation";

bool CheckValidationLayerSupport() {
    uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);
    std::vector<VkLayerProperties> availableLayers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

    for (const auto& layer : availableLayers) {
        if (strcmp(layer.layerName, kValidationLayerName) == 0) {
            return true;
        }
    }
    return false;
}

/// 返回 dev 上的计算队列族；优先不带图形能力的专用计算族。未找到返回 false
bool FindComputeQueueFamily(VkPhysicalDevice dev, uint32_t* outIndex) {
    uint32_t queueFamilyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(dev, &queueFamilyCount, nullptr);
    std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(dev, &queueFamilyCount, queueFamilies.data());

    bool found = false;
    for (uint32_t i = 0; i < queueFamilyCount; ++i) {
        if (!(queueFamilies[i].queueFlags & VK_QUEUE_COMPUTE_BIT)) continue;
        if (!(queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)) {
            *outIndex = i;
            return true;
        }
        if (!found) {
            *outIndex = i;
            found = true;
        }
    }
    return found;
}

}  // namespace

VulkanContext::~VulkanContext() {
    Shutdown();
}

bool VulkanContext::Initialize(const VulkanConfig& config) {
    lastError_.clear();
    if (IsInitialized()) return true;

    if (!CreateInstance(config)) {
        Shutdown();
        return false;
    }
    if (!SelectPhysicalDevice(config)) {
        Shutdown();
        return false;
    }
    if (!CreateLogicalDevice()) {
        Shutdown();
        return false;
    }
    return true;
}

void VulkanContext::Shutdown() {
    if (device_ != nullptr) {
        vkDeviceWaitIdle(device_);
        vkDestroyDevice(device_, nullptr);
        device_ = nullptr;
    }
    physicalDevice_ = nullptr;
    computeQueue_ = nullptr;

    if (instance_ != nullptr) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = nullptr;
    }
    validationEnabled_ = false;
}

bool VulkanContext::CreateInstance(const VulkanConfig& config) {
    validationEnabled_ = config.enableValidation;
    if (validationEnabled_ && !CheckValidationLayerSupport()) {
        lastError_ = "Validation layer requested but VK_LAYER_KHRONOS_validation not available";
        return false;
    }

    VkApplicationInfo appInfo = {};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = "Pigment";
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName = "Pigment";
    appInfo.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.apiVersion = VK_API_VERSION_1_1;

    // 无头计算：不需要任何 surface 扩展
    VkInstanceCreateInfo createInfo = {};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = 0;
    createInfo.ppEnabledExtensionNames = nullptr;

    if (validationEnabled_) {
        createInfo.enabledLayerCount = 1;
        createInfo.ppEnabledLayerNames = &kValidationLayerName;
    } else {
        createInfo.enabledLayerCount = 0;
    }

    VkResult err = vkCreateInstance(&createInfo, nullptr, &instance_);
    if (err != VK_SUCCESS) {
        lastError_ = "vkCreateInstance failed with " + std::to_string(err);
        instance_ = nullptr;
        return false;
    }
    return true;
}

bool VulkanContext::SelectPhysicalDevice(const VulkanConfig& config) {
    uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(instance_, &deviceCount, nullptr);
    if (deviceCount == 0) {
        lastError_ = "No Vulkan physical devices found";
        return false;
    }
    std::vector<VkPhysicalDevice> devices(deviceCount);
    vkEnumeratePhysicalDevices(instance_, &deviceCount, devices.data());

    uint32_t family = 0;
    if (config.preferredDeviceIndex < deviceCount &&
        FindComputeQueueFamily(devices[config.preferredDeviceIndex], &family)) {
        physicalDevice_ = devices[config.preferredDeviceIndex];
        computeQueueFamilyIndex_ = family;
        return true;
    }

    for (VkPhysicalDevice dev : devices) {
        if (FindComputeQueueFamily(dev, &family)) {
            physicalDevice_ = dev;
            computeQueueFamilyIndex_ = family;
            return true;
        }
    }

    lastError_ = "No suitable physical device (compute queue)";
    return false;
}

bool VulkanContext::CreateLogicalDevice() {
    float queuePriority = 1.0f;
    VkDeviceQueueCreateInfo queueCreateInfo = {};
    queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    queueCreateInfo.queueFamilyIndex = computeQueueFamilyIndex_;
    queueCreateInfo.queueCount = 1;
    queueCreateInfo.pQueuePriorities = &queuePriority;

    VkDeviceCreateInfo createInfo = {};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.queueCreateInfoCount = 1;
    createInfo.pQueueCreateInfos = &queueCreateInfo;
    createInfo.enabledExtensionCount = 0;
    createInfo.pEnabledFeatures = nullptr;

    VkResult err = vkCreateDevice(physicalDevice_, &createInfo, nullptr, &device_);
    if (err != VK_SUCCESS) {
        lastError_ = "vkCreateDevice failed with " + std::to_string(err);
        device_ = nullptr;
        return false;
    }

    vkGetDeviceQueue(device_, computeQueueFamilyIndex_, 0, &computeQueue_);
    return true;
}

}  // namespace pigment_device
