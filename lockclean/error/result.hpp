/*
 * result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Value-or-error return type for fallible operations

**************************************************/

#ifndef LOCKCLEAN_ERROR_RESULT_HPP
#define LOCKCLEAN_ERROR_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "error_code.hpp"

namespace lockclean::error {

/**
 * @brief Value or error_code returned by operations that may fail
 */
template <typename T>
class Result {
private:
    std::optional<T> m_value;
    std::error_code m_error;

public:
    Result(T&& value) noexcept : m_value(std::move(value)) {}
    Result(const T& value) : m_value(value) {}
    Result(std::error_code error) noexcept : m_error(error) {}
    Result(InputErrorCode code) noexcept : m_error(make_error_code(code)) {}

    bool has_value() const noexcept { return m_value.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value())
            throw std::runtime_error("Result has no value: " +
                                     m_error.message());
        return *m_value;
    }

    T& value() & {
        if (!has_value())
            throw std::runtime_error("Result has no value: " +
                                     m_error.message());
        return *m_value;
    }

    const T& operator*() const& noexcept { return *m_value; }
    const T* operator->() const noexcept { return &*m_value; }

    std::error_code error() const noexcept { return m_error; }

    template <typename U>
    T value_or(U&& default_value) const& {
        return has_value() ? *m_value
                           : static_cast<T>(std::forward<U>(default_value));
    }
};

template <>
class Result<void> {
private:
    std::error_code m_error;

public:
    Result() noexcept = default;
    Result(std::error_code error) noexcept : m_error(error) {}
    Result(InputErrorCode code) noexcept : m_error(make_error_code(code)) {}

    bool has_value() const noexcept { return !m_error; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            throw std::runtime_error("Result has error: " + m_error.message());
    }

    std::error_code error() const noexcept { return m_error; }
};

}  // namespace lockclean::error

#endif  // LOCKCLEAN_ERROR_RESULT_HPP
