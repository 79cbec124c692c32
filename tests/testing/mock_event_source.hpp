#ifndef LOCKCLEAN_TESTS_MOCK_EVENT_SOURCE_HPP
#define LOCKCLEAN_TESTS_MOCK_EVENT_SOURCE_HPP

#include <gmock/gmock.h>

#include "lockclean/input/event_source.hpp"

namespace lockclean::testing {

class MockEventSource : public input::IEventSource {
public:
    MOCK_METHOD(error::Result<input::TapHandle>, registerTap,
                (input::EventMask mask, input::TapRole role,
                 input::TapCallback callback),
                (override));
    MOCK_METHOD(error::Result<void>, unregisterTap, (input::TapHandle handle),
                (override));
    MOCK_METHOD(error::Result<void>, setTapEnabled,
                (input::TapHandle handle, bool enabled), (override));
    MOCK_METHOD(input::Point, cursorPosition, (), (const, override));
    MOCK_METHOD(error::Result<void>, warpCursor, (input::Point position),
                (override));
    MOCK_METHOD(const char*, platformName, (), (const, noexcept, override));
};

}  // namespace lockclean::testing

#endif  // LOCKCLEAN_TESTS_MOCK_EVENT_SOURCE_HPP
