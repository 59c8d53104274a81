/**
 * @file host_callback_completion_queue.cpp
 * @brief HostCallbackCompletionQueue 实现
 */

#include <pigment_executor/host_callback_completion_queue.hpp>

#include <utility>

namespace pigment::executor {

using pigment_device::FenceHandle;
using pigment_device::FenceStatus;

HostCallbackCompletionQueue::HostCallbackCompletionQueue(HostScheduler scheduler)
    : state_(std::make_shared<State>()) {
    state_->scheduler = std::move(scheduler);
}

HostCallbackCompletionQueue::~HostCallbackCompletionQueue() {
    Stop();
}

bool HostCallbackCompletionQueue::Start(pigment_device::IComputeDevice* device) {
    std::lock_guard lock(state_->mutex);
    if (state_->running || !device || !state_->scheduler) return false;
    state_->device = device;
    state_->running = true;
    state_->stopping = false;
    return true;
}

bool HostCallbackCompletionQueue::Watch(FenceHandle fence, FenceCallback callback) {
    std::lock_guard lock(state_->mutex);
    if (!state_->running || state_->stopping || !fence.IsValid()) return false;
    state_->pending.push_back(Entry{fence, std::move(callback)});
    SchedulePollLocked(state_);
    return true;
}

void HostCallbackCompletionQueue::SchedulePollLocked(const std::shared_ptr<State>& state) {
    if (state->pollScheduled) return;
    state->pollScheduled = true;
    std::weak_ptr<State> weak = state;
    state->scheduler([weak]() { Poll(weak); });
}

void HostCallbackCompletionQueue::Poll(const std::weak_ptr<State>& weak) {
    std::shared_ptr<State> state = weak.lock();
    if (!state) return;
    {
        std::lock_guard lock(state->mutex);
        state->pollScheduled = false;
    }
    PollOnce(state, false);
    std::lock_guard lock(state->mutex);
    if (!state->pending.empty() && !state->stopping) SchedulePollLocked(state);
}

bool HostCallbackCompletionQueue::PollOnce(const std::shared_ptr<State>& state, bool forceLost) {
    std::vector<std::pair<FenceCallback, FenceStatus>> ready;
    bool remaining = false;
    {
        std::lock_guard lock(state->mutex);
        if (!state->device) return false;
        const bool lost = forceLost || state->device->IsDeviceLost();
        for (auto it = state->pending.begin(); it != state->pending.end();) {
            FenceStatus s = lost ? FenceStatus::DeviceLost : state->device->GetFenceStatus(it->fence);
            if (s == FenceStatus::NotReady) {
                ++it;
                continue;
            }
            ready.emplace_back(std::move(it->callback), s);
            it = state->pending.erase(it);
        }
        remaining = !state->pending.empty();
    }
    for (auto& [callback, status] : ready) {
        if (callback) callback(status);
    }
    return remaining;
}

void HostCallbackCompletionQueue::Stop() {
    std::vector<FenceHandle> fences;
    pigment_device::IComputeDevice* device = nullptr;
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->running || state_->stopping) return;
        state_->stopping = true;
        device = state_->device;
    }

    // 关闭路径允许阻塞：直接在调用线程上等待剩余 Fence
    for (;;) {
        fences.clear();
        {
            std::lock_guard lock(state_->mutex);
            for (const Entry& e : state_->pending) fences.push_back(e.fence);
        }
        if (fences.empty()) break;
        FenceStatus status = device->WaitForAnyFence(fences, kDrainSliceNs);
        PollOnce(state_, status == FenceStatus::DeviceLost);
    }

    std::lock_guard lock(state_->mutex);
    state_->running = false;
    state_->device = nullptr;
}

std::size_t HostCallbackCompletionQueue::GetPendingCount() const {
    std::lock_guard lock(state_->mutex);
    return state_->pending.size();
}

}  // namespace pigment::executor
