/**
 * @file completion_queue_native.cpp
 * @brief 原生构建的完成队列工厂：反应线程
 */

#include <pigment_executor/completion_queue.hpp>
#include <pigment_executor/reactor_completion_queue.hpp>

namespace pigment::executor {

std::unique_ptr<ICompletionQueue> CreateCompletionQueue() {
    return std::make_unique<ReactorCompletionQueue>();
}

}  // namespace pigment::executor
