/**
 * @file plan.hpp
 * @brief 静态执行计划：BlendPlanner 的输出，DeviceSession 的输入
 *
 * Plan 只描述要做什么，不持有任何设备资源。
 * 槽以计划内编号 PlanSlotId 引用；输入槽与目标槽携带调用方的 SlotHandle，
 * 临时槽（中间结果）在 Allocate 阶段由会话分配。
 */

#pragma once

#include <pigment_color/pixel_format.hpp>
#include <pigment_device/rdi_types.hpp>
#include <pigment_pipeline/pipeline_key.hpp>
#include <pigment_resource/pixel_buffer.hpp>
#include <pigment_resource/slot_handle.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace pigment::pipeline {

using PlanSlotId = std::uint32_t;
inline constexpr PlanSlotId kNoPlanSlot = 0xFFFFFFFFu;

struct PlanSlot {
    /** 临时槽为无效句柄，由会话在 Allocate 阶段填入 */
    resource::SlotHandle handle{};
    bool transient = false;
    color::PixelFormat format{};
    color::Extent extent{};
};

enum class StageKind {
    Allocate,
    Upload,
    Dispatch,
    Barrier,
    Download,
};

const char* ToString(StageKind kind);

/** 一次合成步的参数；backdrop 为 kNoPlanSlot 时表示透明背景 */
struct DispatchParams {
    pigment_device::PipelineHandle pipeline{};
    PipelineKey key{};
    PlanSlotId backdrop = kNoPlanSlot;
    PlanSlotId source = kNoPlanSlot;
    PlanSlotId output = kNoPlanSlot;
    color::PixelFormat sourceFormat{};
    /** 输出尺寸 */
    color::Extent extent{};
    color::Extent sourceExtent{};
    /** 源在输出中的左上角 */
    color::Offset placement{};
    float opacity = 1.0f;
};

struct PlanStage {
    StageKind kind = StageKind::Dispatch;
    /** Allocate / Upload / Download 的目标槽 */
    PlanSlotId slot = kNoPlanSlot;
    std::shared_ptr<const resource::PixelBuffer> upload;
    std::shared_ptr<resource::PixelBuffer> download;
    DispatchParams dispatch{};
    /** Barrier 覆盖的槽 */
    std::vector<PlanSlotId> barrierSlots;
};

class Plan {
public:
    Plan() = default;

    Plan(Plan&& other) noexcept;
    Plan& operator=(Plan&& other) noexcept;
    Plan(const Plan&) = delete;
    Plan& operator=(const Plan&) = delete;

    bool IsEmpty() const { return stages_.empty(); }

    PlanSlotId AddSlot(const PlanSlot& slot);
    void AddStage(PlanStage stage);

    const std::vector<PlanSlot>& GetSlots() const { return slots_; }
    const std::vector<PlanStage>& GetStages() const { return stages_; }

    std::size_t CountStages(StageKind kind) const;
    std::size_t GetTransientCount() const;

private:
    std::vector<PlanSlot> slots_;
    std::vector<PlanStage> stages_;
};

}  // namespace pigment::pipeline
