/**
 * @file shader_loader.cpp
 * @brief ShaderLoader 实现：路径解析、LoadSPIRV 与 .comp → .comp.spv 约定
 */

#include <pigment_pipeline/shader_loader.hpp>

#include <fstream>
#include <utility>

namespace pigment::pipeline {

namespace {

std::string NormalizePath(const std::string& a, const std::string& b) {
    std::string base = a;
    while (!base.empty() && (base.back() == '/' || base.back() == '\\'))
        base.pop_back();
    std::string p = b;
    while (!p.empty() && (p.front() == '/' || p.front() == '\\'))
        p.erase(0, 1);
    if (base.empty()) return p;
    if (p.empty()) return base;
    return base + "/" + p;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string ShaderLoader::ResolvePath(const std::string& path) const {
    if (basePath_.empty()) return path;
    if (!path.empty() && (path[0] == '/' || path[0] == '\\')) return path;
    return NormalizePath(basePath_, path);
}

bool ShaderLoader::LoadSPIRV(const std::string& path, std::vector<std::uint8_t>& outCode) {
    lastError_.clear();
    outCode.clear();
    std::string resolved = ResolvePath(path);
    std::ifstream f(resolved, std::ios::binary | std::ios::ate);
    if (!f) {
        lastError_ = "ShaderLoader: cannot open file: " + resolved;
        return false;
    }
    std::streamsize size = f.tellg();
    f.seekg(0, std::ios::beg);
    if (size <= 0 || size % 4 != 0) {
        lastError_ = "ShaderLoader: empty or invalid SPIR-V file: " + resolved;
        return false;
    }
    outCode.resize(static_cast<std::size_t>(size));
    if (!f.read(reinterpret_cast<char*>(outCode.data()), size)) {
        lastError_ = "ShaderLoader: read failed: " + resolved;
        outCode.clear();
        return false;
    }
    return true;
}

pigment_device::ShaderHandle ShaderLoader::Load(const std::string& path,
                                                pigment_device::IComputeDevice* device) {
    lastError_.clear();
    if (!device) {
        lastError_ = "ShaderLoader: device is null";
        return pigment_device::ShaderHandle{};
    }
    std::string spvPath = path;
    if (EndsWith(spvPath, ".comp")) {
        spvPath += ".spv";
    } else if (!EndsWith(spvPath, ".spv")) {
        lastError_ = "ShaderLoader: unsupported shader file: " + path;
        return pigment_device::ShaderHandle{};
    }

    std::vector<std::uint8_t> code;
    if (!LoadSPIRV(spvPath, code))
        return pigment_device::ShaderHandle{};

    pigment_device::ShaderDesc desc;
    desc.stage = pigment_device::ShaderStage::Compute;
    desc.code = std::move(code);
    desc.entryPoint = "main";
    pigment_device::ShaderHandle h = device->CreateShader(desc);
    if (!h.IsValid())
        lastError_ = "ShaderLoader: CreateShader failed for " + ResolvePath(spvPath) + ": " +
                     device->GetLastError();
    return h;
}

}  // namespace pigment::pipeline
