#include "mock/mock_route_listener.hh"
#include "route_replay_source.hh"
#include "route_test_utils.hh"
#include "test.hh"
#include "thread_fixture.hh"

using namespace route_test;

namespace
{

constexpr auto kInterval = milliseconds(1000);
constexpr auto kSpeed = 10.0f;

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

        replay = std::make_unique<RouteReplaySource>(std::move(m_route_listener), kInterval, kSpeed);
        source = replay.get();
        SetThread(replay.get());
    }

    void DeliverRouteEvent(IRouteListener::EventType type,
                           std::shared_ptr<const RoutePlan> route = nullptr)
    {
        auto ev = IRouteListener::Event {type, route};

        REQUIRE_CALL(*route_listener, Poll()).RETURN(ev);
        DoRunLoop();
    }

    MockRouteListener* route_listener;
    std::unique_ptr<RouteReplaySource> replay;
    hal::IPositionSource* source;
};

} // namespace

TEST_CASE_FIXTURE(Fixture, "the replay source has no position without a route")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);

    REQUIRE(DoRunLoop() == std::nullopt);
    REQUIRE_FALSE(source->LastKnownPosition());
    REQUIRE_FALSE(source->RequestSingleFix(1s));

    WHEN("waiting for data")
    {
        auto data = source->WaitForData(wakeup_semaphore);

        THEN("the wait times out without a position")
        {
            REQUIRE(data);
            REQUIRE_FALSE(data->position);
        }

        AND_THEN("the caller is woken up again")
        {
            REQUIRE(wakeup_semaphore.try_acquire());
        }
    }
}

TEST_CASE_FIXTURE(Fixture, "the replay source walks the route")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);

    DeliverRouteEvent(IRouteListener::EventType::kReady, MakeRoute({kP0, kP1, kP2}));

    THEN("the first point is emitted right away")
    {
        auto data = source->WaitForData(wakeup_semaphore);

        REQUIRE(data);
        REQUIRE(data->position == kP0);
        REQUIRE(data->speed == kSpeed);
        REQUIRE(data->timestamp == Now());
        REQUIRE_FALSE(replay->Finished());
    }

    WHEN("the interval has passed")
    {
        source->WaitForData(wakeup_semaphore);

        REQUIRE(DoRunLoopAfter(kInterval) == kInterval);

        THEN("the next point is emitted")
        {
            REQUIRE(source->WaitForData(wakeup_semaphore)->position == kP1);
            REQUIRE(source->LastKnownPosition()->position == kP1);
        }

        AND_WHEN("the end of the route is reached")
        {
            REQUIRE(DoRunLoopAfter(kInterval) == kInterval);
            REQUIRE(source->WaitForData(wakeup_semaphore)->position == kP2);

            REQUIRE(DoRunLoopAfter(kInterval) == std::nullopt);

            THEN("the replay is finished")
            {
                REQUIRE(replay->Finished());
            }

            AND_THEN("the last position is still known")
            {
                REQUIRE(source->RequestSingleFix(30s)->position == kP2);
            }
        }
    }

    WHEN("the route is replaced")
    {
        DeliverRouteEvent(IRouteListener::EventType::kReady, MakeRoute({kP2, kP1}));

        THEN("the replay restarts from the new route")
        {
            REQUIRE(source->WaitForData(wakeup_semaphore)->position == kP2);
        }
    }

    WHEN("the route is released")
    {
        source->WaitForData(wakeup_semaphore);
        DeliverRouteEvent(IRouteListener::EventType::kReleased);

        THEN("nothing more is emitted")
        {
            REQUIRE_FALSE(source->WaitForData(wakeup_semaphore)->position);
        }
    }
}

TEST_CASE_FIXTURE(Fixture, "an empty route is not replayed")
{
    ALLOW_CALL(*route_listener, Poll()).RETURN(std::nullopt);

    DeliverRouteEvent(IRouteListener::EventType::kReady, MakeRoute({}));

    REQUIRE_FALSE(source->WaitForData(wakeup_semaphore)->position);
    REQUIRE_FALSE(replay->Finished());
}
