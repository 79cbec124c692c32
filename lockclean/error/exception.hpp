/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Exceptions carrying their throw site

**************************************************/

#ifndef LOCKCLEAN_ERROR_EXCEPTION_HPP
#define LOCKCLEAN_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace lockclean::error {

/**
 * @brief Base exception recording file, line, function and thread.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> fmtStr, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(fmt::format(fmtStr, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class FailToOpenFile : public Exception {
public:
    using Exception::Exception;
};

class InvalidConfigException : public Exception {
public:
    using Exception::Exception;
};

}  // namespace lockclean::error

#define THROW_RUNTIME_ERROR(...)                                          \
    throw lockclean::error::RuntimeError(__FILE__, __LINE__, __func__,   \
                                         __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw lockclean::error::InvalidArgument(__FILE__, __LINE__, __func__, \
                                            __VA_ARGS__)

#define THROW_FAIL_TO_OPEN_FILE(...)                                      \
    throw lockclean::error::FailToOpenFile(__FILE__, __LINE__, __func__,  \
                                           __VA_ARGS__)

#define THROW_INVALID_CONFIG(...)                                    \
    throw lockclean::error::InvalidConfigException(                  \
        __FILE__, __LINE__, __func__, __VA_ARGS__)

#endif  // LOCKCLEAN_ERROR_EXCEPTION_HPP
