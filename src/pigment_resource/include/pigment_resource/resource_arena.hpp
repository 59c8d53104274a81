/**
 * @file resource_arena.hpp
 * @brief 资源竞技场：槽表 + 空闲链 + generation，池化设备缓冲并延迟回收
 *
 * 槽状态：Free（可分配，可能持有池化缓冲）、Live（已发放句柄）、
 * PendingRelease（已 Release 但仍有在途命令引用）。
 * 在途计数归零且非 Live 时回收：generation 递增，缓冲进入池或按预算销毁。
 * 所有成员受 mutex_ 保护，可由提交线程与完成队列线程并发调用。
 */

#pragma once

#include <pigment_color/pixel_format.hpp>
#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>
#include <pigment_resource/slot_handle.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace pigment::resource {

struct ArenaConfig {
    /** 空闲池可保留的缓冲总字节数；超出预算的回收缓冲直接销毁 */
    std::size_t maxPooledBytes = 256u * 1024u * 1024u;
};

/** Resolve 结果：槽当前绑定的设备缓冲与声明格式 */
struct SlotRef {
    pigment_device::BufferHandle buffer{};
    color::PixelFormat format{};
    color::Extent extent{};
    std::size_t capacity = 0;
};

struct ArenaStats {
    std::size_t liveSlots = 0;
    std::size_t pendingReleaseSlots = 0;
    std::size_t pooledSlots = 0;
    std::size_t pooledBytes = 0;
    std::uint64_t deviceAllocations = 0;
};

class ResourceArena {
public:
    explicit ResourceArena(pigment_device::IComputeDevice* device,
                           const ArenaConfig& config = ArenaConfig{});
    ~ResourceArena();

    ResourceArena(const ResourceArena&) = delete;
    ResourceArena& operator=(const ResourceArena&) = delete;

    /**
     * 分配一个 Live 槽。优先复用容量足够的池化缓冲（最佳匹配），否则新建设备缓冲。
     * @throws Error(Validation) extent 为空
     * @throws Error(DeviceLost) 已 InvalidateAll 或设备丢失
     * @throws Error(OutOfMemory) 设备无法分配
     */
    SlotHandle Allocate(const color::PixelFormat& format, const color::Extent& extent);

    /** 延迟释放：无在途引用时立即回收，否则在最后一次 Unref 时回收。失效句柄抛 StaleHandle */
    void Release(SlotHandle handle);

    /** @throws Error(StaleHandle) generation 失配或槽已 Release */
    SlotRef Resolve(SlotHandle handle) const;

    bool IsLive(SlotHandle handle) const;

    /** 在途命令引用 +1；槽须为 Live，否则抛 StaleHandle */
    void AddRef(SlotHandle handle);

    /** 在途命令引用 -1；InvalidateAll 之后的旧句柄被忽略 */
    void Unref(SlotHandle handle);

    /** 设备丢失路径：所有句柄失效、缓冲全部丢弃，之后 Allocate 抛 DeviceLost */
    void InvalidateAll();
    bool IsInvalidated() const;

    /** 销毁所有空闲槽的池化缓冲，返回销毁数量 */
    std::size_t TrimFreePool();

    ArenaStats GetStats() const;

    /** 给定格式与尺寸所需的缓冲字节数（向上取整到 4 字节，着色器按 uint 访问） */
    static std::size_t RequiredBytes(const color::PixelFormat& format, const color::Extent& extent);

private:
    enum class SlotState {
        Free,
        Live,
        PendingRelease,
    };

    struct Slot {
        std::uint32_t generation = 0;
        SlotState state = SlotState::Free;
        std::uint32_t inFlight = 0;
        pigment_device::BufferHandle buffer{};
        std::size_t capacity = 0;
        color::PixelFormat format{};
        color::Extent extent{};
    };

    /** 句柄与当前 generation 匹配且状态为 Live 时返回槽，否则返回 nullptr */
    Slot* FindLiveLocked(SlotHandle handle);
    const Slot* FindLiveLocked(SlotHandle handle) const;
    void ReclaimLocked(std::uint32_t index);
    void DestroySlotBufferLocked(Slot& slot);

    pigment_device::IComputeDevice* device_ = nullptr;
    ArenaConfig config_;

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<std::uint32_t> freeList_;
    std::size_t pooledBytes_ = 0;
    std::uint64_t deviceAllocations_ = 0;
    bool invalidated_ = false;
};

}  // namespace pigment::resource
