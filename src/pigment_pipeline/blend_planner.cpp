/**
 * @file blend_planner.cpp
 * @brief BlendPlanner 实现：校验、活跃性分析、临时槽复用与屏障插入
 */

#include <pigment_pipeline/blend_planner.hpp>

#include <pigment_core/error.hpp>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

namespace pigment::pipeline {

using resource::SlotHandle;
using resource::SlotRef;

namespace {

std::string ExtentString(const color::Extent& e) {
    return std::to_string(e.width) + "x" + std::to_string(e.height);
}

std::string FormatString(const color::PixelFormat& f) {
    return std::string(color::ToString(f.layout)) + "/" + color::ToString(f.space);
}

/** 跟踪自上次屏障以来被写入的槽，在读写这些槽之前插入屏障 */
class BarrierTracker {
public:
    explicit BarrierTracker(Plan& plan) : plan_(plan) {}

    void Touch(std::initializer_list<PlanSlotId> used) {
        std::vector<PlanSlotId> hazards;
        for (PlanSlotId id : used) {
            if (id == kNoPlanSlot) continue;
            if (std::find(dirty_.begin(), dirty_.end(), id) == dirty_.end()) continue;
            if (std::find(hazards.begin(), hazards.end(), id) == hazards.end())
                hazards.push_back(id);
        }
        if (hazards.empty()) return;
        for (PlanSlotId id : hazards)
            dirty_.erase(std::remove(dirty_.begin(), dirty_.end(), id), dirty_.end());
        PlanStage barrier;
        barrier.kind = StageKind::Barrier;
        barrier.barrierSlots = std::move(hazards);
        plan_.AddStage(std::move(barrier));
    }

    void Written(PlanSlotId id) {
        if (std::find(dirty_.begin(), dirty_.end(), id) == dirty_.end()) dirty_.push_back(id);
    }

private:
    Plan& plan_;
    std::vector<PlanSlotId> dirty_;
};

}  // namespace

BlendPlanner::BlendPlanner(const resource::ResourceArena* arena, PipelineCache* cache)
    : arena_(arena), cache_(cache) {}

Plan BlendPlanner::BuildPlan(const BlendRequest& request) const {
    const std::vector<BlendDescriptor>& stack = request.stack;
    if (stack.empty())
        throw Error(ErrorCode::Validation, "BlendPlanner: empty blend stack");

    const SlotHandle dest = stack.front().destination;
    for (const BlendDescriptor& d : stack) {
        if (d.destination != dest)
            throw Error(ErrorCode::Validation,
                        "BlendPlanner: descriptors of one stack target different destinations");
    }
    const SlotRef destRef = arena_->Resolve(dest);

    const std::size_t n = stack.size();
    std::vector<SlotRef> sources;
    sources.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const BlendDescriptor& d = stack[i];
        if (d.source == dest)
            throw Error(ErrorCode::Validation,
                        "BlendPlanner: layer " + std::to_string(i) + " reads its destination");
        if (!(d.opacity >= 0.0f && d.opacity <= 1.0f))
            throw Error(ErrorCode::Validation,
                        "BlendPlanner: layer " + std::to_string(i) + " opacity outside [0,1]");
        SlotRef ref = arena_->Resolve(d.source);
        if (!color::FitsWithin(d.placement, ref.extent, destRef.extent))
            throw Error(ErrorCode::IncompatibleFormats,
                        "BlendPlanner: layer " + std::to_string(i) + " " +
                            ExtentString(ref.extent) + " at (" + std::to_string(d.placement.x) +
                            "," + std::to_string(d.placement.y) +
                            ") does not fit destination " + ExtentString(destRef.extent));
        if (!color::IsBridgeable(ref.format, destRef.format))
            throw Error(ErrorCode::IncompatibleFormats,
                        "BlendPlanner: layer " + std::to_string(i) + " format " +
                            FormatString(ref.format) + " cannot bridge to " +
                            FormatString(destRef.format));
        sources.push_back(ref);
    }

    std::vector<PipelineKey> keys;
    keys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        PipelineKey key{stack[i].mode, stack[i].space,
                        i + 1 == n ? destRef.format : color::kRgba32FLinear};
        if (!cache_->Supports(key))
            throw Error(ErrorCode::UnsupportedMode, "BlendPlanner: no kernel for " + ToString(key));
        keys.push_back(key);
    }

    std::vector<SlotHandle> uploaded;
    for (const UploadRequest& u : request.uploads) {
        auto it = std::find_if(stack.begin(), stack.end(),
                               [&](const BlendDescriptor& d) { return d.source == u.slot; });
        if (it == stack.end())
            throw Error(ErrorCode::Validation,
                        "BlendPlanner: upload target is not a source of this stack");
        if (std::find(uploaded.begin(), uploaded.end(), u.slot) != uploaded.end())
            throw Error(ErrorCode::Validation, "BlendPlanner: slot uploaded twice");
        if (!u.pixels)
            throw Error(ErrorCode::Validation, "BlendPlanner: upload without pixels");
        const SlotRef& ref = sources[static_cast<std::size_t>(it - stack.begin())];
        if (u.pixels->GetFormat() != ref.format || u.pixels->GetExtent() != ref.extent)
            throw Error(ErrorCode::IncompatibleFormats,
                        "BlendPlanner: upload " + FormatString(u.pixels->GetFormat()) + " " +
                            ExtentString(u.pixels->GetExtent()) + " does not match slot " +
                            FormatString(ref.format) + " " + ExtentString(ref.extent));
        uploaded.push_back(u.slot);
    }

    if (!request.download)
        throw Error(ErrorCode::Validation, "BlendPlanner: missing download target");
    if (request.download->GetFormat() != destRef.format ||
        request.download->GetExtent() != destRef.extent)
        throw Error(ErrorCode::IncompatibleFormats,
                    "BlendPlanner: download target does not match destination " +
                        FormatString(destRef.format) + " " + ExtentString(destRef.extent));

    std::vector<pigment_device::PipelineHandle> pipelines;
    pipelines.reserve(n);
    for (const PipelineKey& key : keys) pipelines.push_back(cache_->GetOrBuild(key));

    Plan plan;
    std::unordered_map<SlotHandle, PlanSlotId> inputIds;
    const PlanSlotId destId = plan.AddSlot(PlanSlot{dest, false, destRef.format, destRef.extent});
    std::vector<PlanSlotId> sourceIds(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto [it, inserted] = inputIds.emplace(stack[i].source, kNoPlanSlot);
        if (inserted)
            it->second = plan.AddSlot(
                PlanSlot{stack[i].source, false, sources[i].format, sources[i].extent});
        sourceIds[i] = it->second;
    }

    BarrierTracker barriers(plan);
    for (const UploadRequest& u : request.uploads) {
        const PlanSlotId id = inputIds.at(u.slot);
        barriers.Touch({id});
        PlanStage stage;
        stage.kind = StageKind::Upload;
        stage.slot = id;
        stage.upload = u.pixels;
        plan.AddStage(std::move(stage));
        barriers.Written(id);
    }

    // 左折叠链上第 i 步的结果只被第 i+1 步读取，读完即死亡
    PlanSlotId previous = kNoPlanSlot;
    for (std::size_t i = 0; i < n; ++i) {
        PlanSlotId output;
        if (i + 1 == n) {
            output = destId;
        } else if (previous != kNoPlanSlot && plan.GetSlots()[previous].transient) {
            // 原位改写：逐像素读后写，无跨像素依赖
            output = previous;
        } else {
            output = plan.AddSlot(PlanSlot{SlotHandle{}, true, color::kRgba32FLinear,
                                           destRef.extent});
            PlanStage alloc;
            alloc.kind = StageKind::Allocate;
            alloc.slot = output;
            plan.AddStage(std::move(alloc));
        }

        barriers.Touch({previous, sourceIds[i], output});
        PlanStage stage;
        stage.kind = StageKind::Dispatch;
        stage.dispatch.pipeline = pipelines[i];
        stage.dispatch.key = keys[i];
        stage.dispatch.backdrop = previous;
        stage.dispatch.source = sourceIds[i];
        stage.dispatch.output = output;
        stage.dispatch.sourceFormat = sources[i].format;
        stage.dispatch.extent = destRef.extent;
        stage.dispatch.sourceExtent = sources[i].extent;
        stage.dispatch.placement = stack[i].placement;
        stage.dispatch.opacity = stack[i].opacity;
        plan.AddStage(std::move(stage));
        barriers.Written(output);
        previous = output;
    }

    barriers.Touch({destId});
    PlanStage download;
    download.kind = StageKind::Download;
    download.slot = destId;
    download.download = request.download;
    plan.AddStage(std::move(download));
    return plan;
}

}  // namespace pigment::pipeline
