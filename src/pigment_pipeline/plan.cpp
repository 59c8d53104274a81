/**
 * @file plan.cpp
 * @brief Plan 实现
 */

#include <pigment_pipeline/plan.hpp>

#include <utility>

namespace pigment::pipeline {

const char* ToString(StageKind kind) {
    switch (kind) {
        case StageKind::Allocate: return "Allocate";
        case StageKind::Upload: return "Upload";
        case StageKind::Dispatch: return "Dispatch";
        case StageKind::Barrier: return "Barrier";
        case StageKind::Download: return "Download";
        default: return "Unknown";
    }
}

Plan::Plan(Plan&& other) noexcept
    : slots_(std::move(other.slots_)), stages_(std::move(other.stages_)) {
    other.slots_.clear();
    other.stages_.clear();
}

Plan& Plan::operator=(Plan&& other) noexcept {
    if (this != &other) {
        slots_ = std::move(other.slots_);
        stages_ = std::move(other.stages_);
        other.slots_.clear();
        other.stages_.clear();
    }
    return *this;
}

PlanSlotId Plan::AddSlot(const PlanSlot& slot) {
    slots_.push_back(slot);
    return static_cast<PlanSlotId>(slots_.size() - 1);
}

void Plan::AddStage(PlanStage stage) {
    stages_.push_back(std::move(stage));
}

std::size_t Plan::CountStages(StageKind kind) const {
    std::size_t n = 0;
    for (const PlanStage& s : stages_) {
        if (s.kind == kind) ++n;
    }
    return n;
}

std::size_t Plan::GetTransientCount() const {
    std::size_t n = 0;
    for (const PlanSlot& s : slots_) {
        if (s.transient) ++n;
    }
    return n;
}

}  // namespace pigment::pipeline
