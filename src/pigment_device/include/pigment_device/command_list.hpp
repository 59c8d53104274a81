/**
 * @file command_list.hpp
 * @brief CommandList 计算命令列表纯虚接口
 *
 * 用于录制计算命令：管线绑定、存储缓冲绑定、push constant、Dispatch、缓冲拷贝与屏障。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <pigment_device/rdi_types.hpp>

namespace pigment_device {

/**
 * 命令列表抽象接口。
 * 由 IComputeDevice::BeginCommandList() 返回，录制完成后由 EndCommandList() 结束，
 * 对应提交的 Fence signal 后由 ReleaseCommandList() 归还。
 * 后端实现（如 VulkanCommandList）封装 VkCommandBuffer 与其描述符池。
 * 绑定类调用失败时返回 false 并设置设备的 GetLastFailure()，此后的 Dispatch 无效，
 * 调用方须放弃整个命令列表。
 */
class CommandList {
public:
    virtual ~CommandList() = default;

    // -------------------------------------------------------------------------
    // Pipeline / Resource Binding
    // -------------------------------------------------------------------------

    /** 未知管线返回 false */
    virtual bool BindPipeline(PipelineHandle pipeline) = 0;

    /**
     * 按顺序绑定到当前管线 set 0 的 binding 0..N-1；须在 BindPipeline 之后调用。
     * 数量与管线布局不符、缓冲未知或描述符集分配失败（OutOfMemory）时返回 false。
     */
    virtual bool BindStorageBuffers(const std::vector<BufferHandle>& buffers) = 0;

    /** 超出当前管线 push constant 范围返回 false */
    virtual bool SetPushConstants(const void* data, std::size_t size,
                                  std::size_t offset = 0) = 0;

    // -------------------------------------------------------------------------
    // Compute / Transfer
    // -------------------------------------------------------------------------

    virtual void Dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                          std::uint32_t groupCountZ) = 0;

    /** 缓冲未知返回 false */
    virtual bool CopyBufferToBuffer(BufferHandle srcBuffer, std::size_t srcOffset,
                                    BufferHandle dstBuffer, std::size_t dstOffset,
                                    std::size_t size) = 0;

    // -------------------------------------------------------------------------
    // Resource Barriers
    // -------------------------------------------------------------------------

    /** 对给定缓冲插入写后读/写后写屏障（计算与传输阶段之间） */
    virtual void Barrier(const std::vector<BufferHandle>& buffers) = 0;

    /** 传输写 → 主机读屏障，回读拷贝之后录制 */
    virtual void HostReadBarrier() = 0;
};

}  // namespace pigment_device
