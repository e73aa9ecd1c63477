#pragma once

#include "hal/i_position_source.hh"

#include <trompeloeil/mock.hpp>

class MockPositionSource : public hal::IPositionSource
{
public:
    MAKE_MOCK1(WaitForData, std::optional<hal::RawFix>(os::binary_semaphore&));
    MAKE_MOCK0(LastKnownPosition, std::optional<hal::RawFix>());
    MAKE_MOCK1(RequestSingleFix, std::optional<hal::RawFix>(milliseconds));
};
