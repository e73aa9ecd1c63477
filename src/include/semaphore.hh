#pragma once

#include "time.hh"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace os
{
struct Impl;

// Subset of std::counting_semaphore, backed by the platform
template <ptrdiff_t least_max_value = INT32_MAX>
class counting_semaphore
{
    std::unique_ptr<Impl> m_impl;

public:
    explicit counting_semaphore(ptrdiff_t desired) noexcept;

    ~counting_semaphore();

    counting_semaphore(const counting_semaphore&) = delete;
    counting_semaphore& operator=(const counting_semaphore&) = delete;

    void release(ptrdiff_t update = 1) noexcept;

    void acquire() noexcept;

    bool try_acquire() noexcept;

    template <typename Rep, typename Period>
    bool try_acquire_for(const std::chrono::duration<Rep, Period>& rtime)
    {
        return try_acquire_for_ms(std::chrono::duration_cast<milliseconds>(rtime));
    }

    bool try_acquire_for_ms(const milliseconds rtime);
};

using binary_semaphore = counting_semaphore<1>;

} // namespace os
