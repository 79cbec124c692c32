/*
 * error_code.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Error codes for event taps, triggers and settings storage

**************************************************/

#ifndef LOCKCLEAN_ERROR_ERROR_CODE_HPP
#define LOCKCLEAN_ERROR_ERROR_CODE_HPP

#include <string>
#include <system_error>

namespace lockclean::error {

/**
 * @brief Error categories for input interception and hotkey persistence
 */
enum class InputErrorCode {
    SUCCESS = 0,
    ACCESS_DENIED,
    TAP_CREATION_FAILED,
    NOT_SUPPORTED,
    INVALID_HANDLE,
    INVALID_MASK,
    INVALID_RECORD,
    STORAGE_ERROR,
    PLATFORM_SPECIFIC
};

}  // namespace lockclean::error

namespace std {
template <>
struct is_error_code_enum<lockclean::error::InputErrorCode> : true_type {};
}  // namespace std

namespace lockclean::error {

class InputErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "lockclean";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<InputErrorCode>(ev)) {
            case InputErrorCode::SUCCESS:
                return "Success";
            case InputErrorCode::ACCESS_DENIED:
                return "Input monitoring permission not granted";
            case InputErrorCode::TAP_CREATION_FAILED:
                return "Failed to create event tap";
            case InputErrorCode::NOT_SUPPORTED:
                return "Event taps are not supported on this platform";
            case InputErrorCode::INVALID_HANDLE:
                return "Unknown tap handle";
            case InputErrorCode::INVALID_MASK:
                return "Empty event mask";
            case InputErrorCode::INVALID_RECORD:
                return "Malformed hotkey record";
            case InputErrorCode::STORAGE_ERROR:
                return "Settings storage error";
            case InputErrorCode::PLATFORM_SPECIFIC:
                return "Platform-specific error";
            default:
                return "Unknown error";
        }
    }
};

[[nodiscard]] inline const InputErrorCategory& input_category() noexcept {
    static const InputErrorCategory instance;
    return instance;
}

[[nodiscard]] inline std::error_code make_error_code(
    InputErrorCode e) noexcept {
    return {static_cast<int>(e), input_category()};
}

}  // namespace lockclean::error

#endif  // LOCKCLEAN_ERROR_ERROR_CODE_HPP
