/**
 * @file compute_device.cpp
 * @brief CreateComputeDevice 工厂实现
 */

#include <pigment_device/compute_device.hpp>
#if defined(PIGMENT_HAS_VULKAN_BACKEND)
#include <pigment_device/vulkan_compute_device.hpp>
#endif

namespace pigment_device {

std::unique_ptr<IComputeDevice> CreateComputeDevice(Backend backend) {
    switch (backend) {
        case Backend::Vulkan:
#if defined(PIGMENT_HAS_VULKAN_BACKEND)
            return std::make_unique<VulkanComputeDevice>();
#else
            return nullptr;
#endif
        default:
            return nullptr;
    }
}

}  // namespace pigment_device
