/**
 * @file host_callback_completion_queue.hpp
 * @brief 宿主回调完成队列：由宿主事件循环调度 Fence 检查
 *
 * 没有自有线程。有在途 Fence 时通过 HostScheduler 安排一次 Poll，
 * Poll 检查全部登记的 Fence、回调已完成者，仍有未完成时再安排下一次。
 * WASM 构建中 HostScheduler 为 emscripten_async_call；测试中由用例手动泵送。
 */

#pragma once

#include <pigment_executor/completion_queue.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pigment::executor {

/** 将一个任务交给宿主事件循环稍后执行 */
using HostScheduler = std::function<void(std::function<void()> task)>;

class HostCallbackCompletionQueue : public ICompletionQueue {
public:
    /** Stop 时阻塞等待的时间片 */
    static constexpr std::uint64_t kDrainSliceNs = 5'000'000;

    explicit HostCallbackCompletionQueue(HostScheduler scheduler);
    ~HostCallbackCompletionQueue() override;

    HostCallbackCompletionQueue(const HostCallbackCompletionQueue&) = delete;
    HostCallbackCompletionQueue& operator=(const HostCallbackCompletionQueue&) = delete;

    bool Start(pigment_device::IComputeDevice* device) override;
    bool Watch(pigment_device::FenceHandle fence, FenceCallback callback) override;
    void Stop() override;
    std::size_t GetPendingCount() const override;

private:
    struct Entry {
        pigment_device::FenceHandle fence;
        FenceCallback callback;
    };

    /** 已调度的回调只持有 weak_ptr，队列销毁后到达的 Poll 直接返回 */
    struct State {
        HostScheduler scheduler;
        pigment_device::IComputeDevice* device = nullptr;
        mutable std::mutex mutex;
        std::vector<Entry> pending;
        bool running = false;
        bool stopping = false;
        bool pollScheduled = false;
    };

    static void SchedulePollLocked(const std::shared_ptr<State>& state);
    /** 检查一次全部 Fence 并回调已完成者；返回是否仍有未完成的 Fence */
    static bool PollOnce(const std::shared_ptr<State>& state, bool forceLost);
    static void Poll(const std::weak_ptr<State>& weak);

    std::shared_ptr<State> state_;
};

}  // namespace pigment::executor
