/**
 * @file slot_handle.hpp
 * @brief 资源槽句柄：index + generation
 *
 * 槽被回收时 generation 递增，旧句柄在 Resolve 时失配并报告 StaleHandle。
 */

#pragma once

#include <cstdint>
#include <functional>

namespace pigment::resource {

struct SlotHandle {
    static constexpr std::uint32_t kInvalidIndex = 0xFFFFFFFFu;

    std::uint32_t index = kInvalidIndex;
    std::uint32_t generation = 0;

    bool IsValid() const { return index != kInvalidIndex; }
    bool operator==(const SlotHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const SlotHandle& other) const { return !(*this == other); }
};

}  // namespace pigment::resource

namespace std {
template <>
struct hash<pigment::resource::SlotHandle> {
    size_t operator()(const pigment::resource::SlotHandle& h) const noexcept {
        return hash<uint64_t>()((static_cast<uint64_t>(h.generation) << 32) | h.index);
    }
};
}  // namespace std
