/**
 * @file device_session.cpp
 * @brief DeviceSession 实现：计划录制、提交回滚、Fence 退役与设备丢失传播
 */

#include <pigment_session/device_session.hpp>

#include <pigment_core/error.hpp>
#include <pigment_pipeline/pipeline_key.hpp>

#include <cstring>
#include <exception>
#include <limits>
#include <string>
#include <utility>

namespace pigment::session {

using pigment_device::BufferHandle;
using pigment_device::DeviceResult;
using pigment_device::FenceHandle;
using pigment_device::FenceStatus;
using pipeline::kNoPlanSlot;
using pipeline::PlanSlotId;
using pipeline::StageKind;
using resource::SlotHandle;

namespace {

Error DeviceFailure(pigment_device::IComputeDevice* device, const std::string& what) {
    const pigment_device::DeviceFailureInfo failure = device->GetLastFailure();
    std::string message = "DeviceSession: " + what + ": " + failure.message;
    switch (failure.result) {
        case DeviceResult::OutOfMemory:
            return Error(ErrorCode::OutOfMemory, message);
        case DeviceResult::DeviceLost:
            return Error(ErrorCode::DeviceLost, message);
        default:
            return Error(ErrorCode::Validation, message);
    }
}

std::uint32_t GroupCount(std::uint32_t size) {
    return (size + pipeline::kBlendWorkgroupSize - 1) / pipeline::kBlendWorkgroupSize;
}

}  // namespace

DeviceSession::DeviceSession(pigment_device::IComputeDevice* device,
                             std::unique_ptr<executor::ICompletionQueue> queue,
                             resource::ResourceArena* arena)
    : device_(device), queue_(std::move(queue)), arena_(arena), staging_(device) {
    if (!queue_ || !queue_->Start(device_))
        throw Error(ErrorCode::Validation, "DeviceSession: completion queue failed to start");
}

DeviceSession::~DeviceSession() {
    // Stop 在调用线程上等待剩余 Fence，宿主回调队列在此之后不会再被泵送
    queue_->Stop();
    Drain();
}

SessionToken DeviceSession::Submit(pipeline::Plan&& plan, RetireCallback onRetire) {
    std::lock_guard submitLock(submitMutex_);
    if (!lost_ && device_->IsDeviceLost()) HandleDeviceLost();
    if (lost_) throw Error(ErrorCode::DeviceLost, "DeviceSession: device lost");
    if (plan.IsEmpty()) throw Error(ErrorCode::Validation, "DeviceSession: empty plan");

    pipeline::Plan local = std::move(plan);
    auto sub = std::make_unique<Submission>();
    sub->onRetire = std::move(onRetire);
    {
        std::lock_guard lock(mutex_);
        sub->token.id = nextTokenId_++;
    }

    try {
        Record(local, *sub);
        sub->fence = device_->CreateFence(false);
        if (!sub->fence.IsValid()) throw DeviceFailure(device_, "CreateFence failed");
        if (!device_->Submit({sub->cmd}, sub->fence))
            throw DeviceFailure(device_, "queue submit failed");
    } catch (const Error& e) {
        Rollback(*sub);
        if (e.code() == ErrorCode::DeviceLost) HandleDeviceLost();
        throw;
    } catch (...) {
        Rollback(*sub);
        throw;
    }

    for (const SlotHandle& h : sub->transients) {
        if (arena_->IsLive(h)) arena_->Release(h);
    }
    sub->transients.clear();

    SessionToken token = sub->token;
    token.completion_ = std::make_shared<SessionToken::Completion>();
    token.completion_->future = sub->promise.get_future();
    const FenceHandle fence = sub->fence;
    const std::uint64_t id = token.id;
    {
        std::lock_guard lock(mutex_);
        inFlight_.emplace(id, std::move(sub));
    }

    if (!queue_->Watch(fence, [this, id](FenceStatus status) { OnFenceComplete(id, status); })) {
        // 完成队列已停止：在提交线程上同步等待
        FenceStatus status = FenceStatus::NotReady;
        while (status == FenceStatus::NotReady)
            status = device_->WaitForAnyFence({fence}, std::numeric_limits<std::uint64_t>::max());
        OnFenceComplete(id, status);
    }
    return token;
}

void DeviceSession::Record(const pipeline::Plan& plan, Submission& sub) {
    const auto& slots = plan.GetSlots();
    std::vector<BufferHandle> buffers(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].transient) continue;
        arena_->AddRef(slots[i].handle);
        sub.refs.push_back(slots[i].handle);
        buffers[i] = arena_->Resolve(slots[i].handle).buffer;
    }

    sub.cmd = device_->BeginCommandList();
    if (!sub.cmd) throw DeviceFailure(device_, "BeginCommandList failed");
    pigment_device::CommandList* cmd = sub.cmd;

    for (const pipeline::PlanStage& stage : plan.GetStages()) {
        switch (stage.kind) {
            case StageKind::Allocate: {
                const pipeline::PlanSlot& slot = slots[stage.slot];
                SlotHandle h = arena_->Allocate(slot.format, slot.extent);
                sub.transients.push_back(h);
                arena_->AddRef(h);
                sub.refs.push_back(h);
                buffers[stage.slot] = arena_->Resolve(h).buffer;
                break;
            }
            case StageKind::Upload: {
                const std::size_t bytes = stage.upload->GetByteSize();
                resource::StagingAllocation alloc = staging_.Allocate(bytes);
                if (!alloc.IsValid()) throw DeviceFailure(device_, "staging upload allocation failed");
                sub.uploads.push_back(alloc);
                std::memcpy(alloc.mappedPtr, stage.upload->GetData(), bytes);
                if (!staging_.SubmitUpload(cmd, alloc, buffers[stage.slot], bytes))
                    throw DeviceFailure(device_, "upload copy rejected");
                break;
            }
            case StageKind::Dispatch: {
                const pipeline::DispatchParams& d = stage.dispatch;
                const BufferHandle source = buffers[d.source];
                const BufferHandle backdrop = d.backdrop == kNoPlanSlot ? source : buffers[d.backdrop];
                if (!cmd->BindPipeline(d.pipeline))
                    throw DeviceFailure(device_, "BindPipeline failed");
                if (!cmd->BindStorageBuffers({backdrop, source, buffers[d.output]}))
                    throw DeviceFailure(device_, "BindStorageBuffers failed");

                pipeline::BlendPushConstants pc;
                pc.width = d.extent.width;
                pc.height = d.extent.height;
                pc.sourceWidth = d.sourceExtent.width;
                pc.sourceHeight = d.sourceExtent.height;
                pc.offsetX = d.placement.x;
                pc.offsetY = d.placement.y;
                pc.sourceLayout = static_cast<std::uint32_t>(d.sourceFormat.layout);
                pc.sourceSpace = static_cast<std::uint32_t>(d.sourceFormat.space);
                pc.opacity = d.opacity;
                pc.flags = d.backdrop == kNoPlanSlot ? pipeline::kBlendFlagTransparentBackdrop : 0u;
                if (!cmd->SetPushConstants(&pc, sizeof(pc)))
                    throw DeviceFailure(device_, "SetPushConstants failed");
                cmd->Dispatch(GroupCount(d.extent.width), GroupCount(d.extent.height), 1);
                break;
            }
            case StageKind::Barrier: {
                std::vector<BufferHandle> barrierBuffers;
                barrierBuffers.reserve(stage.barrierSlots.size());
                for (PlanSlotId id : stage.barrierSlots) barrierBuffers.push_back(buffers[id]);
                cmd->Barrier(barrierBuffers);
                break;
            }
            case StageKind::Download: {
                const pipeline::PlanSlot& slot = slots[stage.slot];
                const std::size_t bytes =
                    slot.extent.PixelCount() * color::BytesPerPixel(slot.format.layout);
                resource::StagingAllocation alloc = staging_.Allocate(bytes);
                if (!alloc.IsValid())
                    throw DeviceFailure(device_, "staging readback allocation failed");
                sub.readbacks.push_back(Readback{alloc, stage.download, bytes});
                if (!staging_.SubmitReadback(cmd, buffers[stage.slot], 0, alloc, bytes))
                    throw DeviceFailure(device_, "readback copy rejected");
                cmd->HostReadBarrier();
                break;
            }
        }
    }
    if (!device_->EndCommandList(cmd)) throw DeviceFailure(device_, "EndCommandList failed");
}

void DeviceSession::ReleaseResources(Submission& sub) {
    for (const resource::StagingAllocation& alloc : sub.uploads) staging_.Free(alloc);
    for (const Readback& rb : sub.readbacks) staging_.Free(rb.staging);
    sub.uploads.clear();
    sub.readbacks.clear();
    if (sub.cmd) {
        device_->ReleaseCommandList(sub.cmd);
        sub.cmd = nullptr;
    }
    if (sub.fence.IsValid()) {
        device_->DestroyFence(sub.fence);
        sub.fence = FenceHandle{};
    }
    for (const SlotHandle& h : sub.refs) arena_->Unref(h);
    sub.refs.clear();
}

void DeviceSession::Rollback(Submission& sub) {
    ReleaseResources(sub);
    for (const SlotHandle& h : sub.transients) {
        if (arena_->IsLive(h)) arena_->Release(h);
    }
    sub.transients.clear();
}

void DeviceSession::OnFenceComplete(std::uint64_t id, FenceStatus status) {
    Submission* sub = nullptr;
    {
        std::lock_guard lock(mutex_);
        auto it = inFlight_.find(id);
        if (it == inFlight_.end()) return;
        sub = it->second.get();
    }

    if (status == FenceStatus::Signaled) {
        for (const Readback& rb : sub->readbacks)
            std::memcpy(rb.target->GetData(), rb.staging.mappedPtr, rb.bytes);
    } else {
        HandleDeviceLost();
    }
    ReleaseResources(*sub);

    // 完成回调在此上下文中运行；回调抛出时先完成退役再向上传递
    std::exception_ptr callbackError;
    try {
        if (status == FenceStatus::Signaled) {
            sub->promise.set_value();
        } else {
            sub->promise.set_exception(std::make_exception_ptr(Error(
                ErrorCode::DeviceLost, "DeviceSession: device lost before submission completed")));
        }
        if (sub->onRetire) sub->onRetire(sub->token);
    } catch (...) {
        callbackError = std::current_exception();
    }

    {
        std::lock_guard lock(mutex_);
        inFlight_.erase(id);
        drained_.notify_all();
    }
    if (callbackError) std::rethrow_exception(callbackError);
}

void DeviceSession::HandleDeviceLost() {
    bool expected = false;
    if (lost_.compare_exchange_strong(expected, true)) arena_->InvalidateAll();
}

executor::ExecutorFuture<void> DeviceSession::Await(const SessionToken& token) {
    if (!token.completion_)
        throw Error(ErrorCode::Validation,
                    "DeviceSession: token " + std::to_string(token.id) + " was not issued by Submit");
    if (token.completion_->claimed.exchange(true))
        throw Error(ErrorCode::Validation,
                    "DeviceSession: token " + std::to_string(token.id) + " already awaited");
    return std::move(token.completion_->future);
}

void DeviceSession::Drain() {
    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this]() { return inFlight_.empty(); });
}

std::size_t DeviceSession::GetInFlightCount() const {
    std::lock_guard lock(mutex_);
    return inFlight_.size();
}

}  // namespace pigment::session
