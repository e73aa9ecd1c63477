#pragma once

#include "../position_port.hh"

#include <trompeloeil/mock.hpp>

class MockPositionPort : public IPositionPort
{
public:
    MAKE_MOCK0(Poll, std::optional<Event>());
    MAKE_MOCK1(DoAwakeOn, void(os::binary_semaphore*));
};

class MockPositionFeed : public IPositionFeed
{
public:
    MAKE_MOCK0(AttachListener, std::unique_ptr<IPositionPort>());
};
