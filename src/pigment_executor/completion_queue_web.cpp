/**
 * @file completion_queue_web.cpp
 * @brief WASM 构建的完成队列工厂：Fence 检查经 emscripten_async_call 交给浏览器事件循环
 */

#include <pigment_executor/completion_queue.hpp>
#include <pigment_executor/host_callback_completion_queue.hpp>

#include <emscripten.h>

#include <functional>
#include <memory>
#include <utility>

namespace pigment::executor {

namespace {

void RunHostTask(void* arg) {
    std::unique_ptr<std::function<void()>> task(static_cast<std::function<void()>*>(arg));
    (*task)();
}

}  // namespace

std::unique_ptr<ICompletionQueue> CreateCompletionQueue() {
    HostScheduler scheduler = [](std::function<void()> task) {
        auto* heapTask = new std::function<void()>(std::move(task));
        emscripten_async_call(&RunHostTask, heapTask, 0);
    };
    return std::make_unique<HostCallbackCompletionQueue>(std::move(scheduler));
}

}  // namespace pigment::executor
