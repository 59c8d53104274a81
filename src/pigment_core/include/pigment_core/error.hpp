/**
 * @file error.hpp
 * @brief 合成引擎统一错误分类：ErrorCode 与 Error 异常
 *
 * 规划期错误（IncompatibleFormats / UnsupportedMode）可由调用方改写请求后重试；
 * OutOfMemory 可缩小工作集后重试；DeviceLost 使整个会话及其句柄永久失效；
 * StaleHandle / Validation 为调用方或规划逻辑的编程错误。
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pigment {

enum class ErrorCode {
    StaleHandle,
    IncompatibleFormats,
    UnsupportedMode,
    OutOfMemory,
    DeviceLost,
    Validation,
};

/** 错误码名称，用于异常消息与诊断输出 */
const char* ToString(ErrorCode code);

/** 是否可由调用方重新组织请求后恢复（不含 DeviceLost 与编程错误） */
bool IsRecoverable(ErrorCode code);

/**
 * 引擎异常：携带 ErrorCode，经 ExecutorPromise::set_exception 跨越异步边界传递。
 * what() 形如 "OutOfMemory: ResourceArena: device buffer allocation failed"。
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace pigment
