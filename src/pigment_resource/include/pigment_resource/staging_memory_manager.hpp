/**
 * @file staging_memory_manager.hpp
 * @brief Staging 内存管理器：池化 CPU 可见缓冲，供图层上传与结果回读使用
 *
 * 每个池块是一个持久映射的 Transfer 缓冲，块内按 256 字节对齐线性分配，
 * Free 回收的区间进入空闲链并与相邻区间合并。
 * 提交线程分配、完成队列线程释放，内部以 mutex_ 串行化。
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include <pigment_device/command_list.hpp>
#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>

namespace pigment::resource {

/**
 * @brief Staging 分配块：池中一段可读写的 CPU 内存，对应 GPU Buffer 的一段
 */
struct StagingAllocation {
    pigment_device::BufferHandle buffer{};
    void* mappedPtr = nullptr;
    std::size_t size = 0;
    std::size_t offset = 0;

    bool IsValid() const {
        return buffer.IsValid() && mappedPtr != nullptr && size > 0;
    }
};

class StagingMemoryManager {
public:
    explicit StagingMemoryManager(pigment_device::IComputeDevice* device);
    ~StagingMemoryManager();

    StagingMemoryManager(const StagingMemoryManager&) = delete;
    StagingMemoryManager& operator=(const StagingMemoryManager&) = delete;

    /**
     * @brief 从池中分配一段 Staging 内存
     * @return 有效 StagingAllocation，或无效（buffer.id==0）表示设备分配失败，
     *         原因见 device->GetLastFailure()
     */
    StagingAllocation Allocate(std::size_t size);

    /** @brief 将分配块回收到池；调用方保证 GPU 已不再访问该区间 */
    void Free(const StagingAllocation& alloc);

    /**
     * @brief 录制 staging → 设备缓冲拷贝（图层上传），拷贝长度为 src.size 与 size 的较小者
     * @return 参数无效或命令列表拒绝拷贝时返回 false
     */
    bool SubmitUpload(pigment_device::CommandList* cmd, const StagingAllocation& src,
                      pigment_device::BufferHandle dstBuffer, std::size_t size);

    /** @brief 录制设备缓冲 → staging 拷贝（结果回读），拷贝长度为 dst.size 与 size 的较小者 */
    bool SubmitReadback(pigment_device::CommandList* cmd, pigment_device::BufferHandle srcBuffer,
                        std::size_t srcOffset, const StagingAllocation& dst, std::size_t size);

    /** @brief 销毁完全空闲的池块，返回销毁数量 */
    std::size_t Trim();

    /** @brief 设置池块大小（字节），仅影响后续新创建的池块，默认 16MB */
    void SetPoolSize(std::size_t bytes) { poolSize_ = bytes; }
    std::size_t GetPoolSize() const { return poolSize_; }

    std::size_t GetPoolBufferCount() const;

private:
    struct PoolBuffer {
        pigment_device::BufferHandle handle;
        void* mappedPtr = nullptr;
        std::size_t totalSize = 0;
        std::size_t usedOffset = 0;  /* 线性分配水线 */
        std::size_t liveAllocations = 0;
    };
    struct FreeBlock {
        std::size_t offset = 0;
        std::size_t size = 0;
    };

    static void InsertFreeBlock(std::vector<FreeBlock>& freeList, FreeBlock block);

    pigment_device::IComputeDevice* device_ = nullptr;
    std::size_t poolSize_ = 16 * 1024 * 1024;
    mutable std::mutex mutex_;
    std::vector<PoolBuffer> poolBuffers_;
    std::vector<std::vector<FreeBlock>> freeLists_;  /* 与 poolBuffers_ 一一对应 */
};

}  // namespace pigment::resource
