/**
 * @file device_session.hpp
 * @brief 设备会话：录制并提交计划，经完成队列在 Fence 完成时退役
 *
 * 每次 Submit 把一个 Plan 录制为一个命令列表并以一个 Fence 提交，返回 SessionToken。
 * 计划用到的每个槽在提交前 AddRef，退役时 Unref；
 * Allocate 阶段分配的临时槽在录制后立即 Release，实际回收推迟到退役。
 * 提交由 submitMutex_ 串行化（单逻辑队列）；退役在完成队列的执行上下文中进行。
 *
 * 设备丢失：竞技场失效，所有在途 token 以 DeviceLost 拒绝，之后 Submit 抛 DeviceLost，不重连。
 *
 * 完成通知在完成队列的执行上下文中发出：future 的 on_ready 回调与 RetireCallback 都在那里运行，
 * 宿主回调构建中即宿主事件循环本身，回调内不得阻塞等待其他提交。
 */

#pragma once

#include <pigment_device/command_list.hpp>
#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>
#include <pigment_executor/completion_queue.hpp>
#include <pigment_executor/executor_future.hpp>
#include <pigment_pipeline/plan.hpp>
#include <pigment_resource/pixel_buffer.hpp>
#include <pigment_resource/resource_arena.hpp>
#include <pigment_resource/slot_handle.hpp>
#include <pigment_resource/staging_memory_manager.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace pigment::session {

class DeviceSession;

/**
 * 一次提交的标识。完成状态由 token 自身持有：会话退役后不保留任何记录，
 * 丢弃全部 token 副本即释放完成状态。副本共享同一状态，只能 Await 一次。
 */
struct SessionToken {
    std::uint64_t id = 0;

    SessionToken() = default;
    explicit SessionToken(std::uint64_t tokenId) : id(tokenId) {}

    bool IsValid() const { return id != 0; }
    bool operator==(const SessionToken& other) const { return id == other.id; }
    bool operator!=(const SessionToken& other) const { return id != other.id; }

private:
    friend class DeviceSession;

    struct Completion {
        std::atomic<bool> claimed{false};
        executor::ExecutorFuture<void> future;
    };
    std::shared_ptr<Completion> completion_;
};

/** 提交退役（成功或失败）后在完成队列上下文中调用 */
using RetireCallback = std::function<void(SessionToken token)>;

class DeviceSession {
public:
    /**
     * @param device 已初始化的计算设备，生命周期须长于会话
     * @param queue 完成队列（未 Start），会话构造时以 device 启动
     * @param arena 槽表，生命周期须长于会话
     * @throws Error(Validation) 完成队列无法启动
     */
    DeviceSession(pigment_device::IComputeDevice* device,
                  std::unique_ptr<executor::ICompletionQueue> queue,
                  resource::ResourceArena* arena);
    /** Drain 后停止完成队列 */
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * 录制并提交 plan。失败时已做的一切（引用、临时槽、staging、命令列表、Fence）全部回滚。
     * @throws Error(DeviceLost) 设备已丢失或提交时丢失
     * @throws Error(StaleHandle) 计划引用的槽已失效
     * @throws Error(OutOfMemory) 临时槽、staging 或描述符分配失败
     * @throws Error(Validation) 空计划或设备拒绝命令
     */
    SessionToken Submit(pipeline::Plan&& plan, RetireCallback onRetire = {});

    /**
     * 取得 token 的完成 future，每个 token 只能取一次；退役前后均可调用。
     * 设备错误以 Error 形式经 future 传递。
     * @throws Error(Validation) 非 Submit 返回的 token 或重复 Await
     */
    executor::ExecutorFuture<void> Await(const SessionToken& token);

    /** 阻塞至所有在途提交退役 */
    void Drain();

    bool IsLost() const { return lost_.load(); }
    std::size_t GetInFlightCount() const;

    resource::StagingMemoryManager& GetStaging() { return staging_; }

private:
    struct Readback {
        resource::StagingAllocation staging;
        std::shared_ptr<resource::PixelBuffer> target;
        std::size_t bytes = 0;
    };

    struct Submission {
        SessionToken token;
        pigment_device::CommandList* cmd = nullptr;
        pigment_device::FenceHandle fence{};
        /** 已 AddRef 的槽，退役时逐个 Unref */
        std::vector<resource::SlotHandle> refs;
        /** 本次分配的临时槽，录制成功后 Release */
        std::vector<resource::SlotHandle> transients;
        std::vector<resource::StagingAllocation> uploads;
        std::vector<Readback> readbacks;
        executor::ExecutorPromise<void> promise;
        RetireCallback onRetire;
    };

    void Record(const pipeline::Plan& plan, Submission& sub);
    /** 归还 Submission 持有的全部资源（staging、命令列表、Fence、槽引用） */
    void ReleaseResources(Submission& sub);
    void Rollback(Submission& sub);
    void OnFenceComplete(std::uint64_t id, pigment_device::FenceStatus status);
    void HandleDeviceLost();

    pigment_device::IComputeDevice* device_ = nullptr;
    std::unique_ptr<executor::ICompletionQueue> queue_;
    resource::ResourceArena* arena_ = nullptr;
    resource::StagingMemoryManager staging_;

    std::mutex submitMutex_;
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::unordered_map<std::uint64_t, std::unique_ptr<Submission>> inFlight_;
    std::uint64_t nextTokenId_ = 1;
    std::atomic<bool> lost_{false};
};

}  // namespace pigment::session
