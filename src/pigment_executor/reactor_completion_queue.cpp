/**
 * @file reactor_completion_queue.cpp
 * @brief ReactorCompletionQueue 实现（Linux：epoll + eventfd）
 */

#include <pigment_executor/reactor_completion_queue.hpp>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <thread>
#include <utility>

namespace pigment::executor {

using pigment_device::FenceHandle;
using pigment_device::FenceStatus;

ReactorCompletionQueue::~ReactorCompletionQueue() {
    Stop();
}

bool ReactorCompletionQueue::Start(pigment_device::IComputeDevice* device) {
    std::lock_guard lock(mutex_);
    if (running_ || !device) return false;

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) return false;
    eventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (eventFd_ < 0) {
        close(epollFd_);
        epollFd_ = -1;
        return false;
    }
    epoll_event ev = {};
    ev.events = EPOLLIN;
    ev.data.fd = eventFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, eventFd_, &ev) != 0) {
        close(eventFd_);
        close(epollFd_);
        eventFd_ = -1;
        epollFd_ = -1;
        return false;
    }

    device_ = device;
    running_ = true;
    stopping_ = false;
    thread_ = std::thread([this]() { Run(); });
    return true;
}

bool ReactorCompletionQueue::Watch(FenceHandle fence, FenceCallback callback) {
    std::lock_guard lock(mutex_);
    if (!running_ || stopping_ || !fence.IsValid()) return false;
    pending_.push_back(Entry{fence, std::move(callback)});
    WakeLocked();
    return true;
}

void ReactorCompletionQueue::Stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_ || stopping_) return;
        stopping_ = true;
        WakeLocked();
    }
    if (thread_.joinable()) thread_.join();

    std::lock_guard lock(mutex_);
    running_ = false;
    if (eventFd_ >= 0) close(eventFd_);
    if (epollFd_ >= 0) close(epollFd_);
    eventFd_ = -1;
    epollFd_ = -1;
    device_ = nullptr;
}

std::size_t ReactorCompletionQueue::GetPendingCount() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

void ReactorCompletionQueue::WakeLocked() {
    if (eventFd_ < 0) return;
    const std::uint64_t one = 1;
    // EAGAIN 表示计数已饱和，线程必然会被唤醒
    ssize_t n = write(eventFd_, &one, sizeof(one));
    (void)n;
}

void ReactorCompletionQueue::WaitIdle() {
    epoll_event ev = {};
    int n = epoll_wait(epollFd_, &ev, 1, -1);
    idleWakes_.fetch_add(1);
    if (n < 0) {
        // epoll 持续失败时退化为按时间片轮询，Watch/Stop 最迟一个时间片后被看到
        if (errno != EINTR) std::this_thread::sleep_for(std::chrono::nanoseconds(kWaitSliceNs));
        return;
    }
    std::uint64_t counter = 0;
    while (read(eventFd_, &counter, sizeof(counter)) > 0) {
    }
}

void ReactorCompletionQueue::Run() {
    for (;;) {
        std::vector<FenceHandle> fences;
        {
            std::lock_guard lock(mutex_);
            if (pending_.empty() && stopping_) return;
            fences.reserve(pending_.size());
            for (const Entry& e : pending_) fences.push_back(e.fence);
        }

        if (fences.empty()) {
            WaitIdle();
            continue;
        }

        FenceStatus status = device_->WaitForAnyFence(fences, kWaitSliceNs);
        CompleteReady(status);
    }
}

void ReactorCompletionQueue::CompleteReady(FenceStatus waitStatus) {
    std::vector<std::pair<FenceCallback, FenceStatus>> ready;
    {
        std::lock_guard lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            FenceStatus s = waitStatus == FenceStatus::DeviceLost
                                ? FenceStatus::DeviceLost
                                : device_->GetFenceStatus(it->fence);
            if (s == FenceStatus::NotReady) {
                ++it;
                continue;
            }
            ready.emplace_back(std::move(it->callback), s);
            it = pending_.erase(it);
        }
    }
    // 回调在锁外执行：回调内会回收资源并可能再次 Watch
    for (auto& [callback, status] : ready) {
        if (callback) callback(status);
    }
}

}  // namespace pigment::executor
