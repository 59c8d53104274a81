/**
 * @file completion_queue.hpp
 * @brief 完成队列：监视已提交的 Fence，完成后回调
 *
 * 两种实现按构建平台选择：
 * - 原生：ReactorCompletionQueue，独立反应线程，空闲时阻塞在 epoll 上，
 *   有在途 Fence 时阻塞在设备的 WaitForAnyFence 上；
 * - 浏览器：HostCallbackCompletionQueue，Fence 检查作为宿主调度的回调运行。
 * CreateCompletionQueue() 的定义位于平台对应的源文件中。
 */

#pragma once

#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>

#include <cstddef>
#include <functional>
#include <memory>

namespace pigment::executor {

/** Fence 完成回调：status 为 Signaled 或 DeviceLost，每个 Watch 恰好调用一次 */
using FenceCallback = std::function<void(pigment_device::FenceStatus status)>;

class ICompletionQueue {
public:
    virtual ~ICompletionQueue() = default;

    /** 绑定设备并开始监视；重复 Start 返回 false */
    virtual bool Start(pigment_device::IComputeDevice* device) = 0;

    /**
     * 登记 fence。回调在完成队列的执行上下文中调用（反应线程或宿主回调），
     * 调用时不持有队列内部锁。
     * @return 未 Start 或已 Stop 时返回 false，回调不会被调用
     */
    virtual bool Watch(pigment_device::FenceHandle fence, FenceCallback callback) = 0;

    /** 等待所有已登记 fence 完成（或设备丢失）并回调后停止；可重复调用 */
    virtual void Stop() = 0;

    virtual std::size_t GetPendingCount() const = 0;
};

/** 创建当前构建平台的完成队列（未 Start） */
std::unique_ptr<ICompletionQueue> CreateCompletionQueue();

}  // namespace pigment::executor
