/*
 * keycodes.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Virtual key codes of the Apple extended keyboard layout

**************************************************/

#ifndef LOCKCLEAN_INPUT_KEYCODES_HPP
#define LOCKCLEAN_INPUT_KEYCODES_HPP

#include <cstdint>

namespace lockclean::input {

using KeyCode = std::uint16_t;

/**
 * @brief Layout-independent virtual key codes (HIToolbox Events.h values).
 */
namespace keycode {
// ANSI layout, position-based
inline constexpr KeyCode ANSI_A = 0x00;
inline constexpr KeyCode ANSI_S = 0x01;
inline constexpr KeyCode ANSI_D = 0x02;
inline constexpr KeyCode ANSI_F = 0x03;
inline constexpr KeyCode ANSI_H = 0x04;
inline constexpr KeyCode ANSI_G = 0x05;
inline constexpr KeyCode ANSI_Z = 0x06;
inline constexpr KeyCode ANSI_X = 0x07;
inline constexpr KeyCode ANSI_C = 0x08;
inline constexpr KeyCode ANSI_V = 0x09;
inline constexpr KeyCode ANSI_B = 0x0B;
inline constexpr KeyCode ANSI_Q = 0x0C;
inline constexpr KeyCode ANSI_W = 0x0D;
inline constexpr KeyCode ANSI_E = 0x0E;
inline constexpr KeyCode ANSI_R = 0x0F;
inline constexpr KeyCode ANSI_Y = 0x10;
inline constexpr KeyCode ANSI_T = 0x11;
inline constexpr KeyCode ANSI_1 = 0x12;
inline constexpr KeyCode ANSI_2 = 0x13;
inline constexpr KeyCode ANSI_3 = 0x14;
inline constexpr KeyCode ANSI_4 = 0x15;
inline constexpr KeyCode ANSI_6 = 0x16;
inline constexpr KeyCode ANSI_5 = 0x17;
inline constexpr KeyCode ANSI_EQUAL = 0x18;
inline constexpr KeyCode ANSI_9 = 0x19;
inline constexpr KeyCode ANSI_7 = 0x1A;
inline constexpr KeyCode ANSI_MINUS = 0x1B;
inline constexpr KeyCode ANSI_8 = 0x1C;
inline constexpr KeyCode ANSI_0 = 0x1D;
inline constexpr KeyCode ANSI_RIGHT_BRACKET = 0x1E;
inline constexpr KeyCode ANSI_O = 0x1F;
inline constexpr KeyCode ANSI_U = 0x20;
inline constexpr KeyCode ANSI_LEFT_BRACKET = 0x21;
inline constexpr KeyCode ANSI_I = 0x22;
inline constexpr KeyCode ANSI_P = 0x23;
inline constexpr KeyCode ANSI_L = 0x25;
inline constexpr KeyCode ANSI_J = 0x26;
inline constexpr KeyCode ANSI_QUOTE = 0x27;
inline constexpr KeyCode ANSI_K = 0x28;
inline constexpr KeyCode ANSI_SEMICOLON = 0x29;
inline constexpr KeyCode ANSI_BACKSLASH = 0x2A;
inline constexpr KeyCode ANSI_COMMA = 0x2B;
inline constexpr KeyCode ANSI_SLASH = 0x2C;
inline constexpr KeyCode ANSI_N = 0x2D;
inline constexpr KeyCode ANSI_M = 0x2E;
inline constexpr KeyCode ANSI_PERIOD = 0x2F;
inline constexpr KeyCode ANSI_GRAVE = 0x32;

// Layout-independent keys
inline constexpr KeyCode RETURN = 0x24;
inline constexpr KeyCode TAB = 0x30;
inline constexpr KeyCode SPACE = 0x31;
inline constexpr KeyCode DELETE = 0x33;
inline constexpr KeyCode ESCAPE = 0x35;
inline constexpr KeyCode COMMAND = 0x37;
inline constexpr KeyCode SHIFT = 0x38;
inline constexpr KeyCode CAPS_LOCK = 0x39;
inline constexpr KeyCode OPTION = 0x3A;
inline constexpr KeyCode CONTROL = 0x3B;
inline constexpr KeyCode RIGHT_COMMAND = 0x36;
inline constexpr KeyCode RIGHT_SHIFT = 0x3C;
inline constexpr KeyCode RIGHT_OPTION = 0x3D;
inline constexpr KeyCode RIGHT_CONTROL = 0x3E;
inline constexpr KeyCode FUNCTION = 0x3F;
inline constexpr KeyCode F17 = 0x40;
inline constexpr KeyCode VOLUME_UP = 0x48;
inline constexpr KeyCode VOLUME_DOWN = 0x49;
inline constexpr KeyCode MUTE = 0x4A;
inline constexpr KeyCode F18 = 0x4F;
inline constexpr KeyCode F19 = 0x50;
inline constexpr KeyCode F20 = 0x5A;
inline constexpr KeyCode F5 = 0x60;
inline constexpr KeyCode F6 = 0x61;
inline constexpr KeyCode F7 = 0x62;
inline constexpr KeyCode F3 = 0x63;
inline constexpr KeyCode F8 = 0x64;
inline constexpr KeyCode F9 = 0x65;
inline constexpr KeyCode F11 = 0x67;
inline constexpr KeyCode F13 = 0x69;
inline constexpr KeyCode F16 = 0x6A;
inline constexpr KeyCode F14 = 0x6B;
inline constexpr KeyCode F10 = 0x6D;
inline constexpr KeyCode F12 = 0x6F;
inline constexpr KeyCode F15 = 0x71;
inline constexpr KeyCode HELP = 0x72;
inline constexpr KeyCode HOME = 0x73;
inline constexpr KeyCode PAGE_UP = 0x74;
inline constexpr KeyCode FORWARD_DELETE = 0x75;
inline constexpr KeyCode F4 = 0x76;
inline constexpr KeyCode END = 0x77;
inline constexpr KeyCode F2 = 0x78;
inline constexpr KeyCode PAGE_DOWN = 0x79;
inline constexpr KeyCode F1 = 0x7A;
inline constexpr KeyCode LEFT_ARROW = 0x7B;
inline constexpr KeyCode RIGHT_ARROW = 0x7C;
inline constexpr KeyCode DOWN_ARROW = 0x7D;
inline constexpr KeyCode UP_ARROW = 0x7E;
}  // namespace keycode

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_KEYCODES_HPP
