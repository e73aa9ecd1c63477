#pragma once

#include "base_thread.hh"
#include "hal/i_position_source.hh"
#include "i_route_listener.hh"

#include <atomic>
#include <etl/mutex.h>

/**
 * @brief Position source walking the current route, one point per interval
 *
 * Used on hosts without a location provider.
 */
class RouteReplaySource : public hal::IPositionSource, public os::BaseThread
{
public:
    RouteReplaySource(std::unique_ptr<IRouteListener> route_listener,
                      milliseconds interval,
                      float speed);

    // The last point of the route has been emitted
    bool Finished() const
    {
        return m_finished;
    }

private:
    std::optional<milliseconds> OnActivation() final;

    std::optional<hal::RawFix> WaitForData(os::binary_semaphore& semaphore) final;
    std::optional<hal::RawFix> LastKnownPosition() final;
    std::optional<hal::RawFix> RequestSingleFix(milliseconds timeout) final;

    std::optional<hal::RawFix> CurrentFix();

    std::unique_ptr<IRouteListener> m_route_listener;
    const milliseconds m_interval;
    const float m_speed;

    std::shared_ptr<const RoutePlan> m_route;
    size_t m_next_index {0};

    etl::mutex m_mutex;
    std::optional<GpsPosition> m_position;
    std::atomic_bool m_finished {false};
    os::binary_semaphore m_has_data_semaphore {0};
};
