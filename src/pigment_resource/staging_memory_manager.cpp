/**
 * @file staging_memory_manager.cpp
 * @brief StagingMemoryManager 实现：池分配、合并回收与拷贝录制
 */

#include <pigment_resource/staging_memory_manager.hpp>

#include <algorithm>
#include <cstddef>

namespace pigment::resource {

using namespace pigment_device;

StagingMemoryManager::StagingMemoryManager(IComputeDevice* device) : device_(device) {}

StagingMemoryManager::~StagingMemoryManager() {
    std::lock_guard lock(mutex_);
    if (device_) {
        for (PoolBuffer& pb : poolBuffers_) device_->DestroyBuffer(pb.handle);
    }
    poolBuffers_.clear();
    freeLists_.clear();
}

StagingAllocation StagingMemoryManager::Allocate(std::size_t size) {
    if (!device_ || size == 0) return StagingAllocation{};

    const std::size_t align = 256;  /* 常见上传对齐 */
    const std::size_t alignedSize = (size + align - 1) & ~(align - 1);

    std::lock_guard lock(mutex_);

    /* 1) 在现有池中找空闲块：first fit */
    for (std::size_t i = 0; i < poolBuffers_.size(); ++i) {
        PoolBuffer& pb = poolBuffers_[i];
        auto& freeList = freeLists_[i];
        for (auto it = freeList.begin(); it != freeList.end(); ++it) {
            if (it->size < alignedSize) continue;
            StagingAllocation alloc;
            alloc.buffer = pb.handle;
            alloc.offset = it->offset;
            alloc.size = alignedSize;
            alloc.mappedPtr = static_cast<char*>(pb.mappedPtr) + it->offset;
            if (it->size == alignedSize) {
                freeList.erase(it);
            } else {
                it->offset += alignedSize;
                it->size -= alignedSize;
            }
            ++pb.liveAllocations;
            return alloc;
        }
        /* 2) 线性分配：从 usedOffset 往后 */
        if (pb.usedOffset + alignedSize <= pb.totalSize) {
            StagingAllocation alloc;
            alloc.buffer = pb.handle;
            alloc.offset = pb.usedOffset;
            alloc.size = alignedSize;
            alloc.mappedPtr = static_cast<char*>(pb.mappedPtr) + pb.usedOffset;
            pb.usedOffset += alignedSize;
            ++pb.liveAllocations;
            return alloc;
        }
    }

    /* 3) 分配新池块 */
    BufferDesc desc;
    desc.size = (std::max)(alignedSize, poolSize_);
    desc.usage = BufferUsage::Transfer;
    desc.cpuVisible = true;
    BufferHandle newBuf = device_->CreateBuffer(desc, nullptr);
    if (!newBuf.IsValid()) return StagingAllocation{};

    void* mapped = device_->MapBuffer(newBuf, 0, desc.size);
    if (!mapped) {
        device_->DestroyBuffer(newBuf);
        return StagingAllocation{};
    }
    PoolBuffer pb;
    pb.handle = newBuf;
    pb.mappedPtr = mapped;
    pb.totalSize = desc.size;
    pb.usedOffset = alignedSize;
    pb.liveAllocations = 1;
    poolBuffers_.push_back(pb);
    freeLists_.push_back({});

    StagingAllocation alloc;
    alloc.buffer = newBuf;
    alloc.offset = 0;
    alloc.size = alignedSize;
    alloc.mappedPtr = mapped;
    return alloc;
}

void StagingMemoryManager::InsertFreeBlock(std::vector<FreeBlock>& freeList, FreeBlock block) {
    auto pos = std::lower_bound(freeList.begin(), freeList.end(), block,
                                [](const FreeBlock& a, const FreeBlock& b) { return a.offset < b.offset; });
    pos = freeList.insert(pos, block);
    /* 与后继合并 */
    auto next = pos + 1;
    if (next != freeList.end() && pos->offset + pos->size == next->offset) {
        pos->size += next->size;
        freeList.erase(next);
    }
    /* 与前驱合并 */
    if (pos != freeList.begin()) {
        auto prev = pos - 1;
        if (prev->offset + prev->size == pos->offset) {
            prev->size += pos->size;
            freeList.erase(pos);
        }
    }
}

void StagingMemoryManager::Free(const StagingAllocation& alloc) {
    if (!alloc.IsValid()) return;
    std::lock_guard lock(mutex_);
    for (std::size_t i = 0; i < poolBuffers_.size(); ++i) {
        PoolBuffer& pb = poolBuffers_[i];
        if (pb.handle.id != alloc.buffer.id) continue;
        if (pb.liveAllocations > 0) --pb.liveAllocations;
        if (pb.liveAllocations == 0) {
            /* 整块空闲：重置水线，空闲链清空 */
            pb.usedOffset = 0;
            freeLists_[i].clear();
        } else {
            InsertFreeBlock(freeLists_[i], FreeBlock{alloc.offset, alloc.size});
        }
        return;
    }
}

bool StagingMemoryManager::SubmitUpload(CommandList* cmd, const StagingAllocation& src,
                                        BufferHandle dstBuffer, std::size_t size) {
    if (!cmd || !src.IsValid() || !dstBuffer.IsValid() || size == 0) return false;
    return cmd->CopyBufferToBuffer(src.buffer, src.offset, dstBuffer, 0, (std::min)(size, src.size));
}

bool StagingMemoryManager::SubmitReadback(CommandList* cmd, BufferHandle srcBuffer,
                                          std::size_t srcOffset, const StagingAllocation& dst,
                                          std::size_t size) {
    if (!cmd || !dst.IsValid() || !srcBuffer.IsValid() || size == 0) return false;
    return cmd->CopyBufferToBuffer(srcBuffer, srcOffset, dst.buffer, dst.offset, (std::min)(size, dst.size));
}

std::size_t StagingMemoryManager::Trim() {
    std::lock_guard lock(mutex_);
    std::size_t destroyed = 0;
    for (std::size_t i = poolBuffers_.size(); i-- > 0;) {
        if (poolBuffers_[i].liveAllocations != 0) continue;
        if (device_) device_->DestroyBuffer(poolBuffers_[i].handle);
        poolBuffers_.erase(poolBuffers_.begin() + static_cast<std::ptrdiff_t>(i));
        freeLists_.erase(freeLists_.begin() + static_cast<std::ptrdiff_t>(i));
        ++destroyed;
    }
    return destroyed;
}

std::size_t StagingMemoryManager::GetPoolBufferCount() const {
    std::lock_guard lock(mutex_);
    return poolBuffers_.size();
}

}  // namespace pigment::resource
