#include "mock/mock_position_port.hh"
#include "mock/mock_route_listener.hh"
#include "navigator.hh"
#include "route_test_utils.hh"
#include "test.hh"
#include "thread_fixture.hh"

using namespace route_test;

namespace
{

class TrackedPort : public MockPositionPort
{
public:
    explicit TrackedPort(bool& released)
        : m_released(released)
    {
    }

    ~TrackedPort() override
    {
        m_released = true;
    }

private:
    bool& m_released;
};

class Fixture : public ThreadFixture
{
private:
    std::unique_ptr<MockRouteListener> m_route_listener;

public:
    Fixture()
        : m_route_listener(std::make_unique<MockRouteListener>())
        , route_listener(m_route_listener.get())
    {
        ALLOW_CALL(*route_listener, AwakeOn(_));

        navigator = std::make_unique<Navigator>(
            state, position_feed, std::move(m_route_listener), NavigationConfig {});
        SetThread(navigator.get());
    }

    void DeliverRouteEvent(IRouteListener::EventType type,
                           std::shared_ptr<const RoutePlan> route = nullptr)
    {
        auto ev = IRouteListener::Event {type, route};

        REQUIRE_CALL(*route_listener, Poll()).RETURN(ev);
        DoRunLoop();
    }

    auto Snapshot() const
    {
        return state.CheckoutReadonly();
    }

    NavigationState state;
    MockPositionFeed position_feed;
    MockRouteListener* route_listener;
    std::unique_ptr<Navigator> navigator;

    std::shared_ptr<const RoutePlan> route = MakeRoute(
        {kP0, kP1, kP2},
        {{.instruction = "depart", .location = kP0}, {.instruction = "arrive", .location = kP2}});
};

IPositionPort::Event
FixEvent(GpsPosition position)
{
    return {.type = IPositionPort::EventType::kFix, .fix = MakeFix(position)};
}

} // namespace

TEST_CASE_FIXTURE(Fixture, "navigation is not started without a route")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);
    FORBID_CALL(position_feed, AttachListener());

    navigator->StartNavigation();
    DoRunLoop();

    REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
    REQUIRE(Snapshot()->last_error == NavigationState::Error::kNoRoute);

    AND_WHEN("the route request failed")
    {
        DeliverRouteEvent(IRouteListener::EventType::kReady, MakeRoute({}));

        navigator->StartNavigation();
        DoRunLoop();

        THEN("navigation stays idle")
        {
            REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
        }
    }
}

TEST_CASE_FIXTURE(Fixture, "the navigator tracks position updates along the route")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);

    DeliverRouteEvent(IRouteListener::EventType::kCalculating);
    DeliverRouteEvent(IRouteListener::EventType::kReady, route);
    REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);

    auto port_released = false;
    auto owned_port = std::make_unique<TrackedPort>(port_released);
    auto port = owned_port.get();

    ALLOW_CALL(*port, DoAwakeOn(_));
    ALLOW_CALL(*port, Poll()).RETURN(std::nullopt);
    REQUIRE_CALL(position_feed, AttachListener()).LR_RETURN(std::move(owned_port));

    navigator->StartNavigation();
    DoRunLoop();

    REQUIRE(Snapshot()->session == NavigationState::SessionState::kActive);

    WHEN("fixes arrive")
    {
        {
            trompeloeil::sequence seq;

            REQUIRE_CALL(*port, Poll()).RETURN(FixEvent(kP1)).IN_SEQUENCE(seq);
            REQUIRE_CALL(*port, Poll()).RETURN(FixEvent(East(kP2, -10))).IN_SEQUENCE(seq);
            DoRunLoop();
        }

        THEN("they are all processed, in order")
        {
            REQUIRE(Snapshot()->update_count == 2);
            REQUIRE((Snapshot()->track == std::vector {kP1, kP2}));
            REQUIRE(Snapshot()->next_instruction == "arrive");
        }
    }

    WHEN("the position is unavailable")
    {
        auto ev = IPositionPort::Event {.type = IPositionPort::EventType::kUnavailable, .fix = {}};

        REQUIRE_CALL(*port, Poll()).RETURN(ev);
        DoRunLoop();

        THEN("navigation goes on")
        {
            REQUIRE(Snapshot()->session == NavigationState::SessionState::kActive);
            REQUIRE(Snapshot()->position_unavailable_count == 1);
        }
    }

    WHEN("navigation is stopped")
    {
        navigator->StopNavigation();

        THEN("the subscription is dropped before any more positions are read")
        {
            FORBID_CALL(*port, Poll());

            DoRunLoop();

            REQUIRE(port_released);

            REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
            REQUIRE(Snapshot()->track.empty());
        }
    }

    WHEN("a new route arrives")
    {
        auto new_route = MakeRoute({kP2, kP1, kP0});

        DeliverRouteEvent(IRouteListener::EventType::kReady, new_route);

        THEN("navigation along the old route stops")
        {
            REQUIRE(port_released);
            REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
        }

        AND_WHEN("navigation is started again")
        {
            auto new_port = std::make_unique<MockPositionPort>();

            ALLOW_CALL(*new_port, DoAwakeOn(_));
            ALLOW_CALL(*new_port, Poll()).RETURN(std::nullopt);
            REQUIRE_CALL(position_feed, AttachListener()).LR_RETURN(std::move(new_port));

            navigator->StartNavigation();
            DoRunLoop();

            THEN("the new route is followed from its start")
            {
                REQUIRE(Snapshot()->session == NavigationState::SessionState::kActive);
                REQUIRE((Snapshot()->remaining_route == std::vector {kP2, kP1, kP0}));
            }
        }
    }

    WHEN("the route is released")
    {
        DeliverRouteEvent(IRouteListener::EventType::kReleased);

        THEN("navigation stops")
        {
            REQUIRE(port_released);
            REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
        }

        AND_THEN("it can't be started again")
        {
            FORBID_CALL(position_feed, AttachListener());

            navigator->StartNavigation();
            DoRunLoop();

            REQUIRE(Snapshot()->session == NavigationState::SessionState::kIdle);
            REQUIRE(Snapshot()->last_error == NavigationState::Error::kNoRoute);
        }
    }
}

TEST_CASE_FIXTURE(Fixture, "starting twice keeps the subscription")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);
    DeliverRouteEvent(IRouteListener::EventType::kReady, route);

    auto owned_port = std::make_unique<MockPositionPort>();
    auto port = owned_port.get();

    ALLOW_CALL(*port, DoAwakeOn(_));
    ALLOW_CALL(*port, Poll()).RETURN(std::nullopt);
    REQUIRE_CALL(position_feed, AttachListener()).LR_RETURN(std::move(owned_port));

    navigator->StartNavigation();
    navigator->StartNavigation();
    DoRunLoop();

    REQUIRE(Snapshot()->session == NavigationState::SessionState::kActive);
}

TEST_CASE_FIXTURE(Fixture, "position logging can be toggled while navigating")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);
    DeliverRouteEvent(IRouteListener::EventType::kReady, route);

    auto owned_port = std::make_unique<MockPositionPort>();
    auto port = owned_port.get();

    ALLOW_CALL(*port, DoAwakeOn(_));
    ALLOW_CALL(*port, Poll()).RETURN(std::nullopt);
    REQUIRE_CALL(position_feed, AttachListener()).LR_RETURN(std::move(owned_port));

    navigator->SetPositionLogging(true);
    navigator->StartNavigation();
    DoRunLoop();

    REQUIRE_CALL(*port, Poll()).RETURN(FixEvent(kP1));
    DoRunLoop();

    REQUIRE(Snapshot()->position == kP1);
}
