#pragma once

#include "gps_position.hh"
#include "semaphore.hh"
#include "time.hh"

#include <optional>

namespace hal
{

struct RawFix
{
    std::optional<GpsPosition> position;
    std::optional<float> speed; // m/s
    std::optional<milliseconds> timestamp;
};

class IPositionSource
{
public:
    virtual ~IPositionSource() = default;

    /**
     * @brief block waiting for the next fix from the position stream
     *
     * The semaphore is released when the data arrives.
     *
     * @return the fix, or std::nullopt if the stream reported an error
     */
    virtual std::optional<RawFix> WaitForData(os::binary_semaphore& semaphore) = 0;

    /// @brief the last position the platform knows about, if any
    virtual std::optional<RawFix> LastKnownPosition() = 0;

    /// @brief acquire a single fresh fix, giving up after @a timeout
    virtual std::optional<RawFix> RequestSingleFix(milliseconds timeout) = 0;
};

} // namespace hal
