/**
 * @file rdi_types.hpp
 * @brief 计算设备接口的资源句柄与描述符类型
 *
 * 合成引擎只使用存储缓冲、计算着色器、计算管线与 Fence，
 * 图形管线、纹理与交换链相关类型不在此层出现。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pigment_device {

// =============================================================================
// 资源句柄
// =============================================================================

/** 类型安全资源句柄，id=0 表示无效 */
template <typename Tag>
struct Handle {
    std::uint64_t id = 0;

    bool IsValid() const { return id != 0; }
    bool operator==(const Handle& other) const { return id == other.id; }
    bool operator!=(const Handle& other) const { return id != other.id; }
};

struct Buffer_Tag {};
struct Shader_Tag {};
struct Pipeline_Tag {};
struct Fence_Tag {};

using BufferHandle   = Handle<Buffer_Tag>;
using ShaderHandle   = Handle<Shader_Tag>;
using PipelineHandle = Handle<Pipeline_Tag>;
using FenceHandle    = Handle<Fence_Tag>;

// =============================================================================
// 用途与状态枚举
// =============================================================================

enum class BufferUsage : std::uint32_t {
    Storage  = 1u << 0,
    Transfer = 1u << 1,
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline BufferUsage& operator|=(BufferUsage& a, BufferUsage b) {
    a = a | b;
    return a;
}

inline bool HasBufferUsage(BufferUsage mask, BufferUsage bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

enum class ShaderStage {
    Compute,
};

/** Fence 查询结果 */
enum class FenceStatus {
    NotReady,
    Signaled,
    DeviceLost,
};

/** 最近一次失败调用的分类，供上层映射为 OutOfMemory / DeviceLost / Validation */
enum class DeviceResult {
    Success,
    OutOfMemory,
    DeviceLost,
    Validation,
};

// =============================================================================
// 描述符结构
// =============================================================================

struct BufferDesc {
    std::size_t size = 0;
    BufferUsage usage = BufferUsage::Storage;
    bool cpuVisible = false;
};

struct ShaderDesc {
    ShaderStage stage = ShaderStage::Compute;
    std::vector<std::uint8_t> code;  // SPIR-V
    std::string entryPoint = "main";
};

/**
 * 计算管线描述：一个着色器模块 + 特化常量 + 存储缓冲绑定数 + push constant 大小。
 * specializationConstants[i] 对应 constant_id = i。
 * 存储缓冲固定位于 set 0，binding 0..storageBufferCount-1。
 */
struct ComputePipelineDesc {
    ShaderHandle shader;
    std::vector<std::uint32_t> specializationConstants;
    std::uint32_t storageBufferCount = 0;
    std::uint32_t pushConstantSize = 0;
};

}  // namespace pigment_device
