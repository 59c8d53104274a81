/**
 * @file shader_loader.hpp
 * @brief 着色器加载器：读取构建期 glslc 产出的 .spv，创建计算着色器
 *
 * 不做运行时 GLSL 编译。.comp 路径按约定改读同名 .comp.spv（如 blend.comp → blend.comp.spv）。
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <pigment_device/compute_device.hpp>
#include <pigment_device/rdi_types.hpp>

namespace pigment::pipeline {

class ShaderLoader {
public:
    ShaderLoader() = default;

    /** 设置着色器产物目录，ResolvePath 时拼接 */
    void SetBasePath(const std::string& path) { basePath_ = path; }
    const std::string& GetBasePath() const { return basePath_; }

    /** basePath 非空且 path 非绝对路径时返回 basePath + "/" + path，否则返回 path */
    std::string ResolvePath(const std::string& path) const;

    /**
     * 读取 SPIR-V 二进制到 outCode。
     * @return 失败返回 false 并设置 GetLastError()；文件大小须为 4 的倍数
     */
    bool LoadSPIRV(const std::string& path, std::vector<std::uint8_t>& outCode);

    /**
     * 加载 SPIR-V 并创建计算着色器。
     * @param device 计算设备，不可为 nullptr
     * @return 有效 ShaderHandle 或无效句柄，失败时 GetLastError() 有原因
     */
    pigment_device::ShaderHandle Load(const std::string& path,
                                      pigment_device::IComputeDevice* device);

    const std::string& GetLastError() const { return lastError_; }

private:
    std::string basePath_;
    std::string lastError_;
};

}  // namespace pigment::pipeline
