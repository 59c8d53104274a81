/**
 * @file reactor_completion_queue.hpp
 * @brief 原生完成队列：单反应线程 + epoll/eventfd
 *
 * 空闲时线程阻塞在 epoll_wait 上，Watch 写 eventfd 唤醒；
 * 有在途 Fence 时以 kWaitSliceNs 为时间片阻塞在 WaitForAnyFence 上，
 * 时间片结束后重新读取登记表，使新登记的 Fence 加入等待集合。
 */

#pragma once

#include <pigment_executor/completion_queue.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace pigment::executor {

class ReactorCompletionQueue : public ICompletionQueue {
public:
    static constexpr std::uint64_t kWaitSliceNs = 5'000'000;

    ReactorCompletionQueue() = default;
    ~ReactorCompletionQueue() override;

    ReactorCompletionQueue(const ReactorCompletionQueue&) = delete;
    ReactorCompletionQueue& operator=(const ReactorCompletionQueue&) = delete;

    bool Start(pigment_device::IComputeDevice* device) override;
    bool Watch(pigment_device::FenceHandle fence, FenceCallback callback) override;
    void Stop() override;
    std::size_t GetPendingCount() const override;

    /** 反应线程从空闲等待中返回的累计次数 */
    std::uint64_t GetIdleWakeCount() const { return idleWakes_.load(); }

private:
    struct Entry {
        pigment_device::FenceHandle fence;
        FenceCallback callback;
    };

    void Run();
    /** 须持有 mutex_：Stop 关闭 eventfd 前不会有并发写入 */
    void WakeLocked();
    /** 空闲：阻塞于 epoll，直至 Watch/Stop 写入 eventfd */
    void WaitIdle();
    /** 取出已完成（或设备丢失时全部）条目并逐个回调 */
    void CompleteReady(pigment_device::FenceStatus waitStatus);

    pigment_device::IComputeDevice* device_ = nullptr;
    int epollFd_ = -1;
    int eventFd_ = -1;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<Entry> pending_;
    bool running_ = false;
    bool stopping_ = false;
    std::atomic<std::uint64_t> idleWakes_{0};
};

}  // namespace pigment::executor
