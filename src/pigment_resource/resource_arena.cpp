/**
 * @file resource_arena.cpp
 * @brief ResourceArena 实现
 */

#include <pigment_resource/resource_arena.hpp>

#include <pigment_core/error.hpp>

#include <string>

namespace pigment::resource {

using pigment_device::BufferDesc;
using pigment_device::BufferHandle;
using pigment_device::BufferUsage;
using pigment_device::DeviceResult;

namespace {

std::string DescribeHandle(SlotHandle handle) {
    return "slot " + std::to_string(handle.index) + "@" + std::to_string(handle.generation);
}

}  // namespace

ResourceArena::ResourceArena(pigment_device::IComputeDevice* device, const ArenaConfig& config)
    : device_(device), config_(config) {}

ResourceArena::~ResourceArena() {
    std::lock_guard lock(mutex_);
    for (Slot& slot : slots_) DestroySlotBufferLocked(slot);
    slots_.clear();
    freeList_.clear();
    pooledBytes_ = 0;
}

std::size_t ResourceArena::RequiredBytes(const color::PixelFormat& format,
                                         const color::Extent& extent) {
    const std::size_t bytes = extent.PixelCount() * color::BytesPerPixel(format.layout);
    return (bytes + 3u) & ~static_cast<std::size_t>(3u);
}

ResourceArena::Slot* ResourceArena::FindLiveLocked(SlotHandle handle) {
    if (!handle.IsValid() || handle.index >= slots_.size()) return nullptr;
    Slot& slot = slots_[handle.index];
    if (slot.generation != handle.generation || slot.state != SlotState::Live) return nullptr;
    return &slot;
}

const ResourceArena::Slot* ResourceArena::FindLiveLocked(SlotHandle handle) const {
    if (!handle.IsValid() || handle.index >= slots_.size()) return nullptr;
    const Slot& slot = slots_[handle.index];
    if (slot.generation != handle.generation || slot.state != SlotState::Live) return nullptr;
    return &slot;
}

void ResourceArena::DestroySlotBufferLocked(Slot& slot) {
    if (slot.buffer.IsValid() && device_) device_->DestroyBuffer(slot.buffer);
    slot.buffer = BufferHandle{};
    slot.capacity = 0;
}

SlotHandle ResourceArena::Allocate(const color::PixelFormat& format, const color::Extent& extent) {
    if (extent.IsEmpty()) {
        throw Error(ErrorCode::Validation, "ResourceArena: cannot allocate an empty extent");
    }
    const std::size_t required = RequiredBytes(format, extent);

    std::lock_guard lock(mutex_);
    if (invalidated_ || !device_ || device_->IsDeviceLost()) {
        throw Error(ErrorCode::DeviceLost, "ResourceArena: device lost, allocation refused");
    }

    // 最佳匹配：容量足够的最小池化缓冲；否则取一个不持有缓冲的空闲槽
    std::size_t bestPos = freeList_.size();
    std::size_t emptyPos = freeList_.size();
    for (std::size_t i = 0; i < freeList_.size(); ++i) {
        const Slot& slot = slots_[freeList_[i]];
        if (slot.buffer.IsValid()) {
            if (slot.capacity >= required &&
                (bestPos == freeList_.size() || slot.capacity < slots_[freeList_[bestPos]].capacity)) {
                bestPos = i;
            }
        } else if (emptyPos == freeList_.size()) {
            emptyPos = i;
        }
    }

    std::uint32_t index = 0;
    if (bestPos != freeList_.size()) {
        index = freeList_[bestPos];
        freeList_.erase(freeList_.begin() + static_cast<std::ptrdiff_t>(bestPos));
        pooledBytes_ -= slots_[index].capacity;
    } else {
        BufferDesc desc;
        desc.size = required;
        desc.usage = BufferUsage::Storage | BufferUsage::Transfer;
        desc.cpuVisible = false;
        BufferHandle buffer = device_->CreateBuffer(desc);
        if (!buffer.IsValid()) {
            const pigment_device::DeviceFailureInfo failure = device_->GetLastFailure();
            if (failure.result == DeviceResult::DeviceLost) {
                throw Error(ErrorCode::DeviceLost,
                            "ResourceArena: device lost during allocation: " + failure.message);
            }
            throw Error(ErrorCode::OutOfMemory,
                        "ResourceArena: device buffer allocation of " + std::to_string(required) +
                            " bytes failed: " + failure.message);
        }
        ++deviceAllocations_;

        if (emptyPos != freeList_.size()) {
            index = freeList_[emptyPos];
            freeList_.erase(freeList_.begin() + static_cast<std::ptrdiff_t>(emptyPos));
        } else {
            index = static_cast<std::uint32_t>(slots_.size());
            slots_.emplace_back();
        }
        slots_[index].buffer = buffer;
        slots_[index].capacity = required;
    }

    Slot& slot = slots_[index];
    slot.state = SlotState::Live;
    slot.inFlight = 0;
    slot.format = format;
    slot.extent = extent;
    return SlotHandle{index, slot.generation};
}

void ResourceArena::ReclaimLocked(std::uint32_t index) {
    Slot& slot = slots_[index];
    slot.state = SlotState::Free;
    slot.inFlight = 0;
    ++slot.generation;
    if (slot.buffer.IsValid()) {
        if (invalidated_ || pooledBytes_ + slot.capacity > config_.maxPooledBytes) {
            DestroySlotBufferLocked(slot);
        } else {
            pooledBytes_ += slot.capacity;
        }
    }
    freeList_.push_back(index);
}

void ResourceArena::Release(SlotHandle handle) {
    std::lock_guard lock(mutex_);
    Slot* slot = FindLiveLocked(handle);
    if (!slot) {
        throw Error(ErrorCode::StaleHandle, "ResourceArena: Release of stale " + DescribeHandle(handle));
    }
    if (slot->inFlight == 0) {
        ReclaimLocked(handle.index);
    } else {
        slot->state = SlotState::PendingRelease;
    }
}

SlotRef ResourceArena::Resolve(SlotHandle handle) const {
    std::lock_guard lock(mutex_);
    const Slot* slot = FindLiveLocked(handle);
    if (!slot) {
        throw Error(ErrorCode::StaleHandle, "ResourceArena: Resolve of stale " + DescribeHandle(handle));
    }
    return SlotRef{slot->buffer, slot->format, slot->extent, slot->capacity};
}

bool ResourceArena::IsLive(SlotHandle handle) const {
    std::lock_guard lock(mutex_);
    return FindLiveLocked(handle) != nullptr;
}

void ResourceArena::AddRef(SlotHandle handle) {
    std::lock_guard lock(mutex_);
    Slot* slot = FindLiveLocked(handle);
    if (!slot) {
        throw Error(ErrorCode::StaleHandle, "ResourceArena: AddRef of stale " + DescribeHandle(handle));
    }
    ++slot->inFlight;
}

void ResourceArena::Unref(SlotHandle handle) {
    std::lock_guard lock(mutex_);
    if (!handle.IsValid() || handle.index >= slots_.size()) return;
    Slot& slot = slots_[handle.index];
    // InvalidateAll 已递增 generation 并清零计数
    if (slot.generation != handle.generation || slot.state == SlotState::Free) return;
    if (slot.inFlight > 0) --slot.inFlight;
    if (slot.inFlight == 0 && slot.state == SlotState::PendingRelease) {
        ReclaimLocked(handle.index);
    }
}

void ResourceArena::InvalidateAll() {
    std::lock_guard lock(mutex_);
    invalidated_ = true;
    freeList_.clear();
    for (std::uint32_t i = 0; i < slots_.size(); ++i) {
        Slot& slot = slots_[i];
        DestroySlotBufferLocked(slot);
        ++slot.generation;
        slot.state = SlotState::Free;
        slot.inFlight = 0;
        freeList_.push_back(i);
    }
    pooledBytes_ = 0;
}

bool ResourceArena::IsInvalidated() const {
    std::lock_guard lock(mutex_);
    return invalidated_;
}

std::size_t ResourceArena::TrimFreePool() {
    std::lock_guard lock(mutex_);
    std::size_t destroyed = 0;
    for (std::uint32_t index : freeList_) {
        Slot& slot = slots_[index];
        if (!slot.buffer.IsValid()) continue;
        DestroySlotBufferLocked(slot);
        ++destroyed;
    }
    pooledBytes_ = 0;
    return destroyed;
}

ArenaStats ResourceArena::GetStats() const {
    std::lock_guard lock(mutex_);
    ArenaStats stats;
    for (const Slot& slot : slots_) {
        switch (slot.state) {
            case SlotState::Live: ++stats.liveSlots; break;
            case SlotState::PendingRelease: ++stats.pendingReleaseSlots; break;
            case SlotState::Free:
                if (slot.buffer.IsValid()) ++stats.pooledSlots;
                break;
        }
    }
    stats.pooledBytes = pooledBytes_;
    stats.deviceAllocations = deviceAllocations_;
    return stats;
}

}  // namespace pigment::resource
