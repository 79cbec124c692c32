/*
 * permission.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Accessibility trust check

**************************************************/

#include "permission.hpp"

#include <spdlog/spdlog.h>

#if defined(__APPLE__)
#include <ApplicationServices/ApplicationServices.h>
#include <CoreFoundation/CoreFoundation.h>
#endif

namespace lockclean::input {

auto isProcessTrusted(bool prompt) -> bool {
#if defined(__APPLE__)
    const void* keys[] = {kAXTrustedCheckOptionPrompt};
    const void* values[] = {prompt ? kCFBooleanTrue : kCFBooleanFalse};
    CFDictionaryRef options = CFDictionaryCreate(
        kCFAllocatorDefault, keys, values, 1, &kCFTypeDictionaryKeyCallBacks,
        &kCFTypeDictionaryValueCallBacks);
    bool trusted = AXIsProcessTrustedWithOptions(options);
    if (options != nullptr) {
        CFRelease(options);
    }
    spdlog::debug("[Permission] Accessibility trusted: {}", trusted);
    return trusted;
#else
    (void)prompt;
    spdlog::debug("[Permission] No accessibility trust model on this platform");
    return false;
#endif
}

}  // namespace lockclean::input
