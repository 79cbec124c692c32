/*
 * permission.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Accessibility trust check

**************************************************/

#ifndef LOCKCLEAN_INPUT_PERMISSION_HPP
#define LOCKCLEAN_INPUT_PERMISSION_HPP

namespace lockclean::input {

/**
 * @brief Check whether this process may observe and filter system-wide input.
 * @param prompt Ask the OS to show its permission prompt when not trusted.
 * @return Always false on platforms without an accessibility trust model.
 */
[[nodiscard]] auto isProcessTrusted(bool prompt) -> bool;

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_PERMISSION_HPP
