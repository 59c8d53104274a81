/**
 * @file error.cpp
 * @brief ErrorCode 名称与 Error 构造
 */

#include <pigment_core/error.hpp>

namespace pigment {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::StaleHandle: return "StaleHandle";
        case ErrorCode::IncompatibleFormats: return "IncompatibleFormats";
        case ErrorCode::UnsupportedMode: return "UnsupportedMode";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::DeviceLost: return "DeviceLost";
        case ErrorCode::Validation: return "Validation";
        default: return "Unknown";
    }
}

bool IsRecoverable(ErrorCode code) {
    return code == ErrorCode::IncompatibleFormats || code == ErrorCode::UnsupportedMode ||
           code == ErrorCode::OutOfMemory;
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ToString(code)) + ": " + message), code_(code) {}

}  // namespace pigment
