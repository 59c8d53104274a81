/**
 * @file pipeline_cache.cpp
 * @brief PipelineCache 实现：单飞构建、失败广播、并发预热
 */

#include <pigment_pipeline/pipeline_cache.hpp>

#include <pigment_core/error.hpp>

#include <exception>
#include <memory>
#include <utility>

namespace pigment::pipeline {

using pigment_device::DeviceResult;
using pigment_device::PipelineHandle;
using pigment_device::ShaderHandle;

namespace {

Error DeviceFailure(pigment_device::IComputeDevice* device, const std::string& what) {
    const pigment_device::DeviceFailureInfo failure = device->GetLastFailure();
    std::string message = what + ": " + failure.message;
    switch (failure.result) {
        case DeviceResult::OutOfMemory:
            return Error(ErrorCode::OutOfMemory, message);
        case DeviceResult::DeviceLost:
            return Error(ErrorCode::DeviceLost, message);
        default:
            return Error(ErrorCode::Validation, message);
    }
}

}  // namespace

PipelineCache::PipelineCache(pigment_device::IComputeDevice* device, ShaderLoader* loader,
                             std::string shaderFile)
    : device_(device), loader_(loader), shaderFile_(std::move(shaderFile)) {}

PipelineCache::~PipelineCache() {
    Clear();
}

bool PipelineCache::Supports(const PipelineKey& key) const {
    if (static_cast<std::uint32_t>(key.mode) >= color::kBlendModeCount) return false;
    switch (key.space) {
        case color::ColorSpace::Linear:
        case color::ColorSpace::Srgb:
        case color::ColorSpace::Bt709:
            break;
        default:
            return false;
    }
    switch (key.outputFormat.space) {
        case color::ColorSpace::Linear:
        case color::ColorSpace::Srgb:
        case color::ColorSpace::Bt709:
            break;
        default:
            return false;
    }
    switch (key.outputFormat.layout) {
        case color::PixelLayout::Rgba8:
        case color::PixelLayout::Bgra8:
        case color::PixelLayout::Rgba32F:
            return true;
        default:
            return false;
    }
}

PipelineHandle PipelineCache::GetOrBuild(const PipelineKey& key) {
    if (!Supports(key))
        throw Error(ErrorCode::UnsupportedMode, "PipelineCache: no kernel for " + ToString(key));

    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (it->second.ready) return it->second.handle;
        executor::ExecutorPromise<PipelineHandle> promise;
        auto future = promise.get_future();
        it->second.waiters.push_back(std::move(promise));
        lock.unlock();
        return future.get();
    }
    entries_.emplace(key, Entry{});
    lock.unlock();

    PipelineHandle handle{};
    std::exception_ptr error;
    try {
        handle = Build(key);
    } catch (...) {
        error = std::current_exception();
    }

    std::vector<executor::ExecutorPromise<PipelineHandle>> waiters;
    lock.lock();
    auto node = entries_.find(key);
    waiters = std::move(node->second.waiters);
    if (error) {
        entries_.erase(node);
    } else {
        node->second.ready = true;
        node->second.handle = handle;
    }
    lock.unlock();

    for (auto& waiter : waiters) {
        if (error)
            waiter.set_exception(error);
        else
            waiter.set_value(handle);
    }
    if (error) std::rethrow_exception(error);
    return handle;
}

ShaderHandle PipelineCache::EnsureShaderLocked() {
    if (shader_.IsValid()) return shader_;
    if (device_->IsDeviceLost())
        throw Error(ErrorCode::DeviceLost, "PipelineCache: device lost");
    shader_ = loader_->Load(shaderFile_, device_);
    if (!shader_.IsValid()) {
        if (device_->IsDeviceLost())
            throw Error(ErrorCode::DeviceLost, "PipelineCache: " + loader_->GetLastError());
        throw Error(ErrorCode::Validation, "PipelineCache: " + loader_->GetLastError());
    }
    return shader_;
}

PipelineHandle PipelineCache::Build(const PipelineKey& key) {
    ShaderHandle shader;
    {
        std::lock_guard lock(shaderMutex_);
        shader = EnsureShaderLocked();
        ++activeBuilds_;
    }
    // 无论成功与否都归还计数，Clear 等到计数归零才销毁着色器
    struct BuildScope {
        PipelineCache* cache;
        ~BuildScope() {
            std::lock_guard lock(cache->shaderMutex_);
            if (--cache->activeBuilds_ == 0) cache->shaderIdle_.notify_all();
        }
    } scope{this};

    pigment_device::ComputePipelineDesc desc;
    desc.shader = shader;
    desc.specializationConstants = MakeSpecializationConstants(key);
    desc.storageBufferCount = kBlendStorageBufferCount;
    desc.pushConstantSize = sizeof(BlendPushConstants);

    buildCount_.fetch_add(1);
    PipelineHandle handle = device_->CreateComputePipeline(desc);
    if (!handle.IsValid())
        throw DeviceFailure(device_, "PipelineCache: cannot build " + ToString(key));
    return handle;
}

bool PipelineCache::IsCached(const PipelineKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.ready;
}

std::size_t PipelineCache::GetCachedCount() const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& [key, entry] : entries_) {
        if (entry.ready) ++n;
    }
    return n;
}

executor::ExecutorFuture<void> PipelineCache::PrewarmAsync(::executor::Executor& ex,
                                                           const std::vector<PipelineKey>& keys) {
    if (keys.empty()) return executor::make_ready_future();

    struct PrewarmState {
        std::atomic<std::size_t> remaining{0};
        std::mutex mutex;
        std::exception_ptr firstError;
        executor::ExecutorPromise<void> promise;
    };
    auto state = std::make_shared<PrewarmState>();
    state->remaining = keys.size();
    auto future = state->promise.get_future();

    for (const PipelineKey& key : keys) {
        ex.submit([this, key, state]() {
            try {
                GetOrBuild(key);
            } catch (...) {
                std::lock_guard lock(state->mutex);
                if (!state->firstError) state->firstError = std::current_exception();
            }
            if (state->remaining.fetch_sub(1) == 1) {
                if (state->firstError)
                    state->promise.set_exception(state->firstError);
                else
                    state->promise.set_value();
            }
        });
    }
    return future;
}

void PipelineCache::Clear() {
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.ready) {
                device_->DestroyPipeline(it->second.handle);
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    std::unique_lock lock(shaderMutex_);
    shaderIdle_.wait(lock, [this]() { return activeBuilds_ == 0; });
    if (shader_.IsValid()) {
        device_->DestroyShader(shader_);
        shader_ = ShaderHandle{};
    }
}

std::vector<PipelineKey> PipelineCache::SupportedKeys(const color::PixelFormat& outputFormat) {
    std::vector<PipelineKey> keys;
    const color::ColorSpace spaces[] = {color::ColorSpace::Linear, color::ColorSpace::Srgb,
                                        color::ColorSpace::Bt709};
    for (std::uint32_t m = 0; m < color::kBlendModeCount; ++m) {
        for (color::ColorSpace space : spaces) {
            PipelineKey key{static_cast<color::BlendMode>(m), space, outputFormat};
            keys.push_back(key);
        }
    }
    return keys;
}

}  // namespace pigment::pipeline
