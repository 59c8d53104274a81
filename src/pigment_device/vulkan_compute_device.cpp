/**
 * @file vulkan_compute_device.cpp
 * @brief VulkanComputeDevice 实现（资源表、计算管线、按提交分配的命令缓冲、Fence 轮询；可选 VMA）
 */

#ifdef PIGMENT_USE_VMA
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#endif

#include <pigment_device/rdi_types.hpp>
#include <pigment_device/vulkan_compute_device.hpp>
#include <vulkan/vulkan.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace pigment_device {

namespace {

/// 每个描述符池可容纳的 set 数；池耗尽时命令列表再开一个
constexpr std::uint32_t kDescriptorSetsPerPool = 32;
constexpr std::uint32_t kStorageDescriptorsPerPool = kDescriptorSetsPerPool * 4;

}  // namespace

// =============================================================================
// 生命周期
// =============================================================================

VulkanComputeDevice::~VulkanComputeDevice() {
    Shutdown();
}

bool VulkanComputeDevice::Initialize(const DeviceConfig& config) {
    lastError_.clear();
    lastResult_ = DeviceResult::Success;
    deviceLost_.store(false);

    VulkanConfig vkConfig;
    vkConfig.enableValidation = config.enableValidation;
    vkConfig.preferredDeviceIndex = config.preferredDeviceIndex;
    if (!context_.Initialize(vkConfig)) {
        lastResult_ = DeviceResult::Validation;
        return false;
    }

    VkCommandPoolCreateInfo poolInfo = {};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.queueFamilyIndex = context_.GetComputeQueueFamilyIndex();
    poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    VkResult err = vkCreateCommandPool(context_.GetDevice(), &poolInfo, nullptr, &commandPool_);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkCreateCommandPool failed");
        Shutdown();
        return false;
    }

#ifdef PIGMENT_USE_VMA
    {
        VmaAllocatorCreateInfo vmaInfo = {};
        vmaInfo.instance = context_.GetInstance();
        vmaInfo.physicalDevice = context_.GetPhysicalDevice();
        vmaInfo.device = context_.GetDevice();
        vmaInfo.vulkanApiVersion = VK_API_VERSION_1_1;
        VmaAllocator alloc = nullptr;
        if (vmaCreateAllocator(&vmaInfo, &alloc) != VK_SUCCESS) {
            lastError_ = "VulkanComputeDevice: VMA allocator creation failed";
            lastResult_ = DeviceResult::Validation;
            Shutdown();
            return false;
        }
        vmaAllocator_ = alloc;
    }
#endif

    {
        VkPhysicalDeviceProperties props = {};
        vkGetPhysicalDeviceProperties(context_.GetPhysicalDevice(), &props);
        for (int i = 0; i < 3; ++i) {
            capabilities_.maxComputeWorkGroupSize[i] = props.limits.maxComputeWorkGroupSize[i];
            capabilities_.maxComputeWorkGroupCount[i] = props.limits.maxComputeWorkGroupCount[i];
        }
        capabilities_.maxStorageBufferRange = props.limits.maxStorageBufferRange;
        capabilities_.maxPushConstantsSize = props.limits.maxPushConstantsSize;
        capabilities_.deviceName = props.deviceName;
    }
    return true;
}

void VulkanComputeDevice::Shutdown() {
    if (!context_.IsInitialized()) return;

    VkDevice dev = context_.GetDevice();
    vkDeviceWaitIdle(dev);

    std::lock_guard<std::mutex> lock(mutex_);

    // 命令列表先于命令池销毁
    for (auto& [ptr, list] : commandLists_) {
        for (VkDescriptorPool pool : list->descriptorPools_)
            vkDestroyDescriptorPool(dev, pool, nullptr);
        list->descriptorPools_.clear();
    }
    commandLists_.clear();
    if (commandPool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(dev, commandPool_, nullptr);
        commandPool_ = VK_NULL_HANDLE;
    }

    for (auto& [id, fence] : fences_) {
        if (fence != VK_NULL_HANDLE) vkDestroyFence(dev, fence, nullptr);
    }
    fences_.clear();

    std::vector<std::uint64_t> bufferIds;
    bufferIds.reserve(buffers_.size());
    for (const auto& [id, res] : buffers_) bufferIds.push_back(id);
    for (std::uint64_t id : bufferIds) DestroyBufferLocked(id);

    for (auto& [id, res] : pipelines_) {
        if (res.pipeline != VK_NULL_HANDLE) vkDestroyPipeline(dev, res.pipeline, nullptr);
        if (res.layout != VK_NULL_HANDLE) vkDestroyPipelineLayout(dev, res.layout, nullptr);
        if (res.setLayout != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(dev, res.setLayout, nullptr);
    }
    pipelines_.clear();

    for (auto& [id, res] : shaders_) {
        if (res.module != VK_NULL_HANDLE) vkDestroyShaderModule(dev, res.module, nullptr);
    }
    shaders_.clear();

#ifdef PIGMENT_USE_VMA
    if (vmaAllocator_) {
        vmaDestroyAllocator(static_cast<VmaAllocator>(vmaAllocator_));
        vmaAllocator_ = nullptr;
    }
#endif

    context_.Shutdown();
    capabilities_ = DeviceCapabilities{};
}

std::string VulkanComputeDevice::GetLastError() const {
    return GetLastFailure().message;
}

DeviceResult VulkanComputeDevice::GetLastResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastResult_;
}

DeviceFailureInfo VulkanComputeDevice::GetLastFailure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceFailureInfo info;
    info.result = lastResult_;
    info.message = lastError_.empty() ? context_.GetLastError() : lastError_;
    return info;
}

bool VulkanComputeDevice::IsDeviceLost() const {
    return deviceLost_.load();
}

void VulkanComputeDevice::RecordFailure(VkResult result, const std::string& message) {
    lastResult_ = ToDeviceResult(result);
    lastError_ = message + " (VkResult " + std::to_string(result) + ")";
    if (result == VK_ERROR_DEVICE_LOST) deviceLost_.store(true);
}

// =============================================================================
// 内存与 Buffer
// =============================================================================

uint32_t VulkanComputeDevice::FindMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags props) {
    VkPhysicalDeviceMemoryProperties memProps;
    vkGetPhysicalDeviceMemoryProperties(context_.GetPhysicalDevice(), &memProps);

    for (uint32_t i = 0; i < memProps.memoryTypeCount; ++i) {
        if ((typeFilter & (1u << i)) &&
            (memProps.memoryTypes[i].propertyFlags & props) == props) {
            return i;
        }
    }
    return UINT32_MAX;
}

bool VulkanComputeDevice::CreateVmaOrAllocBuffer(const BufferDesc& desc, VkBuffer* outBuffer,
                                                 VkDeviceMemory* outMemory, void** outVmaAllocation) {
    VkDevice dev = context_.GetDevice();

    VkBufferCreateInfo bufInfo = {};
    bufInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufInfo.size = desc.size;
    bufInfo.usage = ToVkBufferUsage(desc.usage);
    bufInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

#ifdef PIGMENT_USE_VMA
    if (vmaAllocator_ && outVmaAllocation) {
        VmaAllocator alloc = static_cast<VmaAllocator>(vmaAllocator_);
        VmaAllocationCreateInfo allocCreateInfo = {};
        allocCreateInfo.usage = desc.cpuVisible ? VMA_MEMORY_USAGE_GPU_TO_CPU : VMA_MEMORY_USAGE_GPU_ONLY;
        if (desc.cpuVisible)
            allocCreateInfo.flags = VMA_ALLOCATION_CREATE_MAPPED_BIT;
        VmaAllocation allocation = nullptr;
        VkResult err = vmaCreateBuffer(alloc, &bufInfo, &allocCreateInfo, outBuffer, &allocation, nullptr);
        if (err != VK_SUCCESS) {
            RecordFailure(err, "VulkanComputeDevice: vmaCreateBuffer failed");
            return false;
        }
        *outVmaAllocation = allocation;
        *outMemory = VK_NULL_HANDLE;
        return true;
    }
#else
    (void)outVmaAllocation;
#endif

    VkResult err = vkCreateBuffer(dev, &bufInfo, nullptr, outBuffer);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkCreateBuffer failed");
        return false;
    }

    VkMemoryRequirements memReqs;
    vkGetBufferMemoryRequirements(dev, *outBuffer, &memReqs);

    VkMemoryPropertyFlags wantProps = desc.cpuVisible
        ? (VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT)
        : VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;

    uint32_t memTypeIndex = FindMemoryType(memReqs.memoryTypeBits, wantProps);
    if (memTypeIndex == UINT32_MAX) {
        vkDestroyBuffer(dev, *outBuffer, nullptr);
        *outBuffer = VK_NULL_HANDLE;
        lastResult_ = DeviceResult::OutOfMemory;
        lastError_ = "VulkanComputeDevice: no memory type for buffer";
        return false;
    }

    VkMemoryAllocateInfo allocInfo = {};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memReqs.size;
    allocInfo.memoryTypeIndex = memTypeIndex;

    err = vkAllocateMemory(dev, &allocInfo, nullptr, outMemory);
    if (err != VK_SUCCESS) {
        vkDestroyBuffer(dev, *outBuffer, nullptr);
        *outBuffer = VK_NULL_HANDLE;
        RecordFailure(err, "VulkanComputeDevice: vkAllocateMemory failed");
        return false;
    }
    vkBindBufferMemory(dev, *outBuffer, *outMemory, 0);
    return true;
}

BufferHandle VulkanComputeDevice::CreateBuffer(const BufferDesc& desc, const void* data) {
    if (!context_.IsInitialized()) return BufferHandle{};
    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceLost_.load()) {
        lastResult_ = DeviceResult::DeviceLost;
        lastError_ = "VulkanComputeDevice: device lost";
        return BufferHandle{};
    }
    if (desc.size == 0) {
        lastResult_ = DeviceResult::Validation;
        lastError_ = "VulkanComputeDevice: zero-sized buffer";
        return BufferHandle{};
    }
    // 设备本地缓冲的初始数据由上层经 staging 拷贝写入
    if (data && !desc.cpuVisible) {
        lastResult_ = DeviceResult::Validation;
        lastError_ = "VulkanComputeDevice: initial data requires a cpuVisible buffer";
        return BufferHandle{};
    }

    void* vmaAlloc = nullptr;
    VkBuffer buf = VK_NULL_HANDLE;
    VkDeviceMemory mem = VK_NULL_HANDLE;
    if (!CreateVmaOrAllocBuffer(desc, &buf, &mem, &vmaAlloc)) {
        return BufferHandle{};
    }

    std::uint64_t id = nextBufferId_++;
    void* mappedPtr = nullptr;
#ifdef PIGMENT_USE_VMA
    if (vmaAlloc && desc.cpuVisible) {
        VmaAllocationInfo allocInfo = {};
        vmaGetAllocationInfo(static_cast<VmaAllocator>(vmaAllocator_),
                             static_cast<VmaAllocation>(vmaAlloc), &allocInfo);
        mappedPtr = allocInfo.pMappedData;
    }
#endif
    if (!mappedPtr && desc.cpuVisible && mem != VK_NULL_HANDLE) {
        void* mapped = nullptr;
        if (vkMapMemory(context_.GetDevice(), mem, 0, desc.size, 0, &mapped) == VK_SUCCESS)
            mappedPtr = mapped;
    }
    if (mappedPtr && data) memcpy(mappedPtr, data, desc.size);

    buffers_[id] = VulkanBufferRes{buf, mem, desc.size, desc.cpuVisible, mappedPtr};
    if (vmaAlloc) bufferAllocations_[id] = vmaAlloc;
    BufferHandle h;
    h.id = id;
    return h;
}

void VulkanComputeDevice::DestroyBufferLocked(std::uint64_t id) {
    auto it = buffers_.find(id);
    if (it == buffers_.end()) return;
    VulkanBufferRes& res = it->second;
    VkDevice dev = context_.GetDevice();
#ifdef PIGMENT_USE_VMA
    auto allocIt = bufferAllocations_.find(id);
    if (allocIt != bufferAllocations_.end()) {
        VmaAllocator alloc = static_cast<VmaAllocator>(vmaAllocator_);
        if (alloc) vmaDestroyBuffer(alloc, res.buffer, static_cast<VmaAllocation>(allocIt->second));
        bufferAllocations_.erase(allocIt);
        buffers_.erase(it);
        return;
    }
#endif
    if (res.mappedPtr) {
        vkUnmapMemory(dev, res.memory);
        res.mappedPtr = nullptr;
    }
    if (res.buffer != VK_NULL_HANDLE) vkDestroyBuffer(dev, res.buffer, nullptr);
    if (res.memory != VK_NULL_HANDLE) vkFreeMemory(dev, res.memory, nullptr);
    buffers_.erase(it);
}

void VulkanComputeDevice::DestroyBuffer(BufferHandle handle) {
    if (!handle.IsValid() || !context_.IsInitialized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    DestroyBufferLocked(handle.id);
}

void* VulkanComputeDevice::MapBuffer(BufferHandle handle, std::size_t offset, std::size_t size) {
    if (!handle.IsValid()) return nullptr;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(handle.id);
    if (it == buffers_.end() || !it->second.mappedPtr) return nullptr;
    const VulkanBufferRes& res = it->second;
    if (offset + size > res.size) return nullptr;
    return static_cast<char*>(res.mappedPtr) + offset;
}

void VulkanComputeDevice::UnmapBuffer(BufferHandle handle) {
    (void)handle;
    /* 持久映射，在 DestroyBuffer 时统一 unmap */
}

bool VulkanComputeDevice::LookupBuffer(BufferHandle handle, VulkanBufferRes* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(handle.id);
    if (it == buffers_.end()) return false;
    *out = it->second;
    return true;
}

bool VulkanComputeDevice::LookupPipeline(PipelineHandle handle, VulkanPipelineRes* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(handle.id);
    if (it == pipelines_.end()) return false;
    *out = it->second;
    return true;
}

// =============================================================================
// Shader / Compute Pipeline
// =============================================================================

ShaderHandle VulkanComputeDevice::CreateShader(const ShaderDesc& desc) {
    if (!context_.IsInitialized()) return ShaderHandle{};
    std::lock_guard<std::mutex> lock(mutex_);
    if (desc.code.empty() || desc.code.size() % 4 != 0) {
        lastResult_ = DeviceResult::Validation;
        lastError_ = "VulkanComputeDevice: SPIR-V code empty or not 4-byte aligned";
        return ShaderHandle{};
    }

    VkShaderModuleCreateInfo createInfo = {};
    createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    createInfo.codeSize = desc.code.size();
    createInfo.pCode = reinterpret_cast<const uint32_t*>(desc.code.data());

    VkShaderModule mod = VK_NULL_HANDLE;
    VkResult err = vkCreateShaderModule(context_.GetDevice(), &createInfo, nullptr, &mod);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkCreateShaderModule failed");
        return ShaderHandle{};
    }

    std::uint64_t id = nextShaderId_++;
    shaders_[id] = VulkanShaderRes{mod, desc.stage};
    ShaderHandle h;
    h.id = id;
    return h;
}

PipelineHandle VulkanComputeDevice::CreateComputePipeline(const ComputePipelineDesc& desc) {
    if (!context_.IsInitialized()) return PipelineHandle{};
    std::lock_guard<std::mutex> lock(mutex_);
    auto shaderIt = shaders_.find(desc.shader.id);
    if (shaderIt == shaders_.end()) {
        lastResult_ = DeviceResult::Validation;
        lastError_ = "VulkanComputeDevice: CreateComputePipeline with unknown shader";
        return PipelineHandle{};
    }
    VkDevice dev = context_.GetDevice();

    // set 0：binding 0..N-1 均为存储缓冲
    std::vector<VkDescriptorSetLayoutBinding> bindings(desc.storageBufferCount);
    for (std::uint32_t i = 0; i < desc.storageBufferCount; ++i) {
        bindings[i] = {};
        bindings[i].binding = i;
        bindings[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    }
    VkDescriptorSetLayoutCreateInfo setInfo = {};
    setInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    setInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    setInfo.pBindings = bindings.empty() ? nullptr : bindings.data();

    VulkanPipelineRes res;
    res.storageBufferCount = desc.storageBufferCount;
    res.pushConstantSize = desc.pushConstantSize;
    VkResult err = vkCreateDescriptorSetLayout(dev, &setInfo, nullptr, &res.setLayout);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkCreateDescriptorSetLayout failed");
        return PipelineHandle{};
    }

    VkPushConstantRange pushRange = {};
    pushRange.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    pushRange.offset = 0;
    pushRange.size = desc.pushConstantSize;

    VkPipelineLayoutCreateInfo layoutInfo = {};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = 1;
    layoutInfo.pSetLayouts = &res.setLayout;
    if (desc.pushConstantSize > 0) {
        layoutInfo.pushConstantRangeCount = 1;
        layoutInfo.pPushConstantRanges = &pushRange;
    }
    err = vkCreatePipelineLayout(dev, &layoutInfo, nullptr, &res.layout);
    if (err != VK_SUCCESS) {
        vkDestroyDescriptorSetLayout(dev, res.setLayout, nullptr);
        RecordFailure(err, "VulkanComputeDevice: vkCreatePipelineLayout failed");
        return PipelineHandle{};
    }

    // 特化常量 constant_id = i，均为 32 位
    std::vector<VkSpecializationMapEntry> mapEntries(desc.specializationConstants.size());
    for (std::size_t i = 0; i < mapEntries.size(); ++i) {
        mapEntries[i].constantID = static_cast<std::uint32_t>(i);
        mapEntries[i].offset = static_cast<std::uint32_t>(i * sizeof(std::uint32_t));
        mapEntries[i].size = sizeof(std::uint32_t);
    }
    VkSpecializationInfo specInfo = {};
    specInfo.mapEntryCount = static_cast<std::uint32_t>(mapEntries.size());
    specInfo.pMapEntries = mapEntries.empty() ? nullptr : mapEntries.data();
    specInfo.dataSize = desc.specializationConstants.size() * sizeof(std::uint32_t);
    specInfo.pData = desc.specializationConstants.empty() ? nullptr : desc.specializationConstants.data();

    VkPipelineShaderStageCreateInfo stageInfo = {};
    stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stageInfo.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    stageInfo.module = shaderIt->second.module;
    stageInfo.pName = "main";
    stageInfo.pSpecializationInfo = mapEntries.empty() ? nullptr : &specInfo;

    VkComputePipelineCreateInfo pipelineInfo = {};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineInfo.stage = stageInfo;
    pipelineInfo.layout = res.layout;

    err = vkCreateComputePipelines(dev, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &res.pipeline);
    if (err != VK_SUCCESS) {
        vkDestroyPipelineLayout(dev, res.layout, nullptr);
        vkDestroyDescriptorSetLayout(dev, res.setLayout, nullptr);
        RecordFailure(err, "VulkanComputeDevice: vkCreateComputePipelines failed");
        return PipelineHandle{};
    }

    std::uint64_t id = nextPipelineId_++;
    pipelines_[id] = res;
    PipelineHandle h;
    h.id = id;
    return h;
}

void VulkanComputeDevice::DestroyShader(ShaderHandle handle) {
    if (!handle.IsValid() || !context_.IsInitialized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shaders_.find(handle.id);
    if (it == shaders_.end()) return;
    if (it->second.module != VK_NULL_HANDLE)
        vkDestroyShaderModule(context_.GetDevice(), it->second.module, nullptr);
    shaders_.erase(it);
}

void VulkanComputeDevice::DestroyPipeline(PipelineHandle handle) {
    if (!handle.IsValid() || !context_.IsInitialized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(handle.id);
    if (it == pipelines_.end()) return;
    VkDevice dev = context_.GetDevice();
    if (it->second.pipeline != VK_NULL_HANDLE) vkDestroyPipeline(dev, it->second.pipeline, nullptr);
    if (it->second.layout != VK_NULL_HANDLE) vkDestroyPipelineLayout(dev, it->second.layout, nullptr);
    if (it->second.setLayout != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(dev, it->second.setLayout, nullptr);
    pipelines_.erase(it);
}

// =============================================================================
// 命令与同步
// =============================================================================

CommandList* VulkanComputeDevice::BeginCommandList() {
    if (!context_.IsInitialized()) return nullptr;
    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceLost_.load()) {
        lastResult_ = DeviceResult::DeviceLost;
        lastError_ = "VulkanComputeDevice: device lost";
        return nullptr;
    }

    VkCommandBufferAllocateInfo allocInfo = {};
    allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool = commandPool_;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;
    VkCommandBuffer buf = VK_NULL_HANDLE;
    VkResult err = vkAllocateCommandBuffers(context_.GetDevice(), &allocInfo, &buf);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkAllocateCommandBuffers failed");
        return nullptr;
    }

    VkCommandBufferBeginInfo beginInfo = {};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    err = vkBeginCommandBuffer(buf, &beginInfo);
    if (err != VK_SUCCESS) {
        vkFreeCommandBuffers(context_.GetDevice(), commandPool_, 1, &buf);
        RecordFailure(err, "VulkanComputeDevice: vkBeginCommandBuffer failed");
        return nullptr;
    }

    auto list = std::make_unique<VulkanCommandList>(this, buf);
    CommandList* raw = list.get();
    commandLists_[raw] = std::move(list);
    return raw;
}

bool VulkanComputeDevice::EndCommandList(CommandList* cmd) {
    if (!cmd) return false;
    auto* vc = static_cast<VulkanCommandList*>(cmd);
    VkResult err = vkEndCommandBuffer(vc->GetCommandBuffer());
    if (err != VK_SUCCESS) {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordFailure(err, "VulkanComputeDevice: vkEndCommandBuffer failed");
        return false;
    }
    return true;
}

void VulkanComputeDevice::ReleaseCommandList(CommandList* cmd) {
    if (!cmd || !context_.IsInitialized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commandLists_.find(cmd);
    if (it == commandLists_.end()) return;
    VkDevice dev = context_.GetDevice();
    VulkanCommandList* vc = it->second.get();
    for (VkDescriptorPool pool : vc->descriptorPools_)
        vkDestroyDescriptorPool(dev, pool, nullptr);
    vc->descriptorPools_.clear();
    VkCommandBuffer buf = vc->GetCommandBuffer();
    if (buf != VK_NULL_HANDLE) vkFreeCommandBuffers(dev, commandPool_, 1, &buf);
    commandLists_.erase(it);
}

bool VulkanComputeDevice::Submit(const std::vector<CommandList*>& cmdLists, FenceHandle fence) {
    if (!context_.IsInitialized() || cmdLists.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceLost_.load()) {
        lastResult_ = DeviceResult::DeviceLost;
        lastError_ = "VulkanComputeDevice: device lost";
        return false;
    }

    std::vector<VkCommandBuffer> vkBuffers;
    vkBuffers.reserve(cmdLists.size());
    for (CommandList* c : cmdLists) {
        auto* vc = static_cast<VulkanCommandList*>(c);
        vkBuffers.push_back(vc->GetCommandBuffer());
    }

    VkFence submitFence = VK_NULL_HANDLE;
    if (fence.IsValid()) {
        auto it = fences_.find(fence.id);
        if (it == fences_.end()) {
            lastResult_ = DeviceResult::Validation;
            lastError_ = "VulkanComputeDevice: Submit with unknown fence";
            return false;
        }
        submitFence = it->second;
    }

    VkSubmitInfo submitInfo = {};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = static_cast<std::uint32_t>(vkBuffers.size());
    submitInfo.pCommandBuffers = vkBuffers.data();
    VkResult err = vkQueueSubmit(context_.GetComputeQueue(), 1, &submitInfo, submitFence);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkQueueSubmit failed");
        return false;
    }
    return true;
}

void VulkanComputeDevice::WaitIdle() {
    if (!context_.IsInitialized()) return;
    VkResult err = vkDeviceWaitIdle(context_.GetDevice());
    if (err != VK_SUCCESS) {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordFailure(err, "VulkanComputeDevice: vkDeviceWaitIdle failed");
    }
}

FenceHandle VulkanComputeDevice::CreateFence(bool signaled) {
    if (!context_.IsInitialized()) return FenceHandle{};
    std::lock_guard<std::mutex> lock(mutex_);
    VkFenceCreateInfo info = {};
    info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    info.flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : 0u;
    VkFence f = VK_NULL_HANDLE;
    VkResult err = vkCreateFence(context_.GetDevice(), &info, nullptr, &f);
    if (err != VK_SUCCESS) {
        RecordFailure(err, "VulkanComputeDevice: vkCreateFence failed");
        return FenceHandle{};
    }
    std::uint64_t id = nextFenceId_++;
    fences_[id] = f;
    FenceHandle h;
    h.id = id;
    return h;
}

void VulkanComputeDevice::DestroyFence(FenceHandle fence) {
    if (!fence.IsValid() || !context_.IsInitialized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fences_.find(fence.id);
    if (it == fences_.end()) return;
    if (it->second != VK_NULL_HANDLE) vkDestroyFence(context_.GetDevice(), it->second, nullptr);
    fences_.erase(it);
}

FenceStatus VulkanComputeDevice::GetFenceStatus(FenceHandle fence) const {
    if (!fence.IsValid() || !context_.IsInitialized()) return FenceStatus::NotReady;
    if (deviceLost_.load()) return FenceStatus::DeviceLost;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fences_.find(fence.id);
    if (it == fences_.end()) return FenceStatus::NotReady;
    VkResult r = vkGetFenceStatus(context_.GetDevice(), it->second);
    if (r == VK_ERROR_DEVICE_LOST) deviceLost_.store(true);
    return ToFenceStatus(r);
}

FenceStatus VulkanComputeDevice::WaitForAnyFence(const std::vector<FenceHandle>& fences,
                                                 std::uint64_t timeoutNs) {
    if (!context_.IsInitialized()) return FenceStatus::NotReady;
    if (deviceLost_.load()) return FenceStatus::DeviceLost;

    // 在锁内拷出 VkFence，等待期间不持锁，避免阻塞其他线程的资源操作
    std::vector<VkFence> vkFences;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        vkFences.reserve(fences.size());
        for (FenceHandle h : fences) {
            auto it = fences_.find(h.id);
            if (it != fences_.end()) vkFences.push_back(it->second);
        }
    }
    if (vkFences.empty()) return FenceStatus::NotReady;

    VkResult r = vkWaitForFences(context_.GetDevice(), static_cast<std::uint32_t>(vkFences.size()),
                                 vkFences.data(), VK_FALSE, timeoutNs);
    if (r == VK_ERROR_DEVICE_LOST) {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordFailure(r, "VulkanComputeDevice: vkWaitForFences reported device lost");
    }
    return ToFenceStatus(r);
}

const DeviceCapabilities& VulkanComputeDevice::GetCapabilities() const {
    return capabilities_;
}

// =============================================================================
// VulkanCommandList 实现
// =============================================================================

VulkanCommandList::VulkanCommandList(VulkanComputeDevice* device, VkCommandBuffer buffer)
    : device_(device), commandBuffer_(buffer) {}

VkDescriptorSet VulkanCommandList::AllocateDescriptorSet(VkDescriptorSetLayout layout) {
    VkDevice dev = device_->context_.GetDevice();
    VkDescriptorSetAllocateInfo allocInfo = {};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &layout;

    VkDescriptorSet set = VK_NULL_HANDLE;
    if (!descriptorPools_.empty()) {
        allocInfo.descriptorPool = descriptorPools_.back();
        VkResult err = vkAllocateDescriptorSets(dev, &allocInfo, &set);
        if (err == VK_SUCCESS) return set;
        if (err != VK_ERROR_OUT_OF_POOL_MEMORY && err != VK_ERROR_FRAGMENTED_POOL) {
            std::lock_guard<std::mutex> lock(device_->mutex_);
            device_->RecordFailure(err, "VulkanCommandList: vkAllocateDescriptorSets failed");
            return VK_NULL_HANDLE;
        }
    }

    VkDescriptorPoolSize poolSize = {};
    poolSize.type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    poolSize.descriptorCount = kStorageDescriptorsPerPool;
    VkDescriptorPoolCreateInfo poolInfo = {};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = kDescriptorSetsPerPool;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &poolSize;
    VkDescriptorPool pool = VK_NULL_HANDLE;
    VkResult err = vkCreateDescriptorPool(dev, &poolInfo, nullptr, &pool);
    if (err != VK_SUCCESS) {
        std::lock_guard<std::mutex> lock(device_->mutex_);
        device_->RecordFailure(err, "VulkanCommandList: vkCreateDescriptorPool failed");
        return VK_NULL_HANDLE;
    }
    descriptorPools_.push_back(pool);

    allocInfo.descriptorPool = pool;
    err = vkAllocateDescriptorSets(dev, &allocInfo, &set);
    if (err != VK_SUCCESS) {
        std::lock_guard<std::mutex> lock(device_->mutex_);
        device_->RecordFailure(err, "VulkanCommandList: vkAllocateDescriptorSets failed");
        return VK_NULL_HANDLE;
    }
    return set;
}

bool VulkanCommandList::Reject(const std::string& message) {
    std::lock_guard<std::mutex> lock(device_->mutex_);
    device_->lastResult_ = DeviceResult::Validation;
    device_->lastError_ = message;
    return false;
}

bool VulkanCommandList::BindPipeline(PipelineHandle pipeline) {
    if (!device_ || !commandBuffer_) return false;
    VulkanPipelineRes res;
    if (!pipeline.IsValid() || !device_->LookupPipeline(pipeline, &res))
        return Reject("VulkanCommandList: BindPipeline with unknown pipeline " +
                      std::to_string(pipeline.id));
    currentPipeline_ = res;
    vkCmdBindPipeline(commandBuffer_, VK_PIPELINE_BIND_POINT_COMPUTE, res.pipeline);
    return true;
}

bool VulkanCommandList::BindStorageBuffers(const std::vector<BufferHandle>& buffers) {
    if (!device_ || !commandBuffer_) return false;
    if (currentPipeline_.layout == VK_NULL_HANDLE)
        return Reject("VulkanCommandList: BindStorageBuffers before BindPipeline");
    if (buffers.size() != currentPipeline_.storageBufferCount)
        return Reject("VulkanCommandList: pipeline expects " +
                      std::to_string(currentPipeline_.storageBufferCount) +
                      " storage buffers, got " + std::to_string(buffers.size()));

    std::vector<VkDescriptorBufferInfo> infos(buffers.size());
    for (std::size_t i = 0; i < buffers.size(); ++i) {
        VulkanBufferRes res;
        if (!device_->LookupBuffer(buffers[i], &res))
            return Reject("VulkanCommandList: unknown storage buffer " +
                          std::to_string(buffers[i].id));
        infos[i].buffer = res.buffer;
        infos[i].offset = 0;
        infos[i].range = VK_WHOLE_SIZE;
    }

    // 失败原因（通常为 OutOfMemory）已由 AllocateDescriptorSet 记录
    VkDescriptorSet set = AllocateDescriptorSet(currentPipeline_.setLayout);
    if (set == VK_NULL_HANDLE) return false;

    std::vector<VkWriteDescriptorSet> writes(buffers.size());
    for (std::size_t i = 0; i < buffers.size(); ++i) {
        writes[i] = {};
        writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet = set;
        writes[i].dstBinding = static_cast<std::uint32_t>(i);
        writes[i].descriptorCount = 1;
        writes[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        writes[i].pBufferInfo = &infos[i];
    }
    vkUpdateDescriptorSets(device_->context_.GetDevice(), static_cast<std::uint32_t>(writes.size()),
                           writes.data(), 0, nullptr);
    vkCmdBindDescriptorSets(commandBuffer_, VK_PIPELINE_BIND_POINT_COMPUTE,
                            currentPipeline_.layout, 0, 1, &set, 0, nullptr);
    return true;
}

bool VulkanCommandList::SetPushConstants(const void* data, std::size_t size, std::size_t offset) {
    if (!device_ || !commandBuffer_) return false;
    if (!data || currentPipeline_.layout == VK_NULL_HANDLE)
        return Reject("VulkanCommandList: SetPushConstants without data or pipeline");
    if (offset + size > currentPipeline_.pushConstantSize)
        return Reject("VulkanCommandList: push constants [" + std::to_string(offset) + ", " +
                      std::to_string(offset + size) + ") exceed pipeline range " +
                      std::to_string(currentPipeline_.pushConstantSize));
    vkCmdPushConstants(commandBuffer_, currentPipeline_.layout, VK_SHADER_STAGE_COMPUTE_BIT,
                       static_cast<std::uint32_t>(offset), static_cast<std::uint32_t>(size), data);
    return true;
}

void VulkanCommandList::Dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                                 std::uint32_t groupCountZ) {
    if (commandBuffer_)
        vkCmdDispatch(commandBuffer_, groupCountX, groupCountY, groupCountZ);
}

bool VulkanCommandList::CopyBufferToBuffer(BufferHandle srcBuffer, std::size_t srcOffset,
                                           BufferHandle dstBuffer, std::size_t dstOffset,
                                           std::size_t size) {
    if (!device_ || !commandBuffer_) return false;
    if (size == 0) return true;
    VulkanBufferRes src;
    VulkanBufferRes dst;
    if (!device_->LookupBuffer(srcBuffer, &src) || !device_->LookupBuffer(dstBuffer, &dst))
        return Reject("VulkanCommandList: CopyBufferToBuffer with unknown buffer");
    VkBufferCopy copy = {};
    copy.srcOffset = srcOffset;
    copy.dstOffset = dstOffset;
    copy.size = size;
    vkCmdCopyBuffer(commandBuffer_, src.buffer, dst.buffer, 1, &copy);
    return true;
}

void VulkanCommandList::Barrier(const std::vector<BufferHandle>& buffers) {
    if (!device_ || !commandBuffer_ || buffers.empty()) return;
    std::vector<VkBufferMemoryBarrier> barriers;
    barriers.reserve(buffers.size());
    for (BufferHandle h : buffers) {
        VulkanBufferRes res;
        if (!device_->LookupBuffer(h, &res)) continue;
        VkBufferMemoryBarrier b = {};
        b.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
        b.srcAccessMask = VK_ACCESS_SHADER_WRITE_BIT | VK_ACCESS_TRANSFER_WRITE_BIT;
        b.dstAccessMask = VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT |
                          VK_ACCESS_TRANSFER_READ_BIT | VK_ACCESS_TRANSFER_WRITE_BIT;
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.buffer = res.buffer;
        b.offset = 0;
        b.size = VK_WHOLE_SIZE;
        barriers.push_back(b);
    }
    if (barriers.empty()) return;
    const VkPipelineStageFlags stages = VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT | VK_PIPELINE_STAGE_TRANSFER_BIT;
    vkCmdPipelineBarrier(commandBuffer_, stages, stages, 0, 0, nullptr,
                         static_cast<std::uint32_t>(barriers.size()), barriers.data(), 0, nullptr);
}

void VulkanCommandList::HostReadBarrier() {
    if (!commandBuffer_) return;
    VkMemoryBarrier b = {};
    b.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
    b.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    b.dstAccessMask = VK_ACCESS_HOST_READ_BIT;
    vkCmdPipelineBarrier(commandBuffer_, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_HOST_BIT,
                         0, 1, &b, 0, nullptr, 0, nullptr);
}

}  // namespace pigment_device
