#include "semaphore.hh"

#include <algorithm>

// Single-threaded semaphore for the unit tests: nothing ever blocks
namespace os
{

struct Impl
{
    explicit Impl(ptrdiff_t desired)
        : value(desired)
    {
    }

    ptrdiff_t value;
};

template <ptrdiff_t least_max_value>
counting_semaphore<least_max_value>::counting_semaphore(ptrdiff_t desired) noexcept
    : m_impl(std::make_unique<Impl>(desired))
{
}

template <ptrdiff_t least_max_value>
counting_semaphore<least_max_value>::~counting_semaphore() = default;

template <ptrdiff_t least_max_value>
void
counting_semaphore<least_max_value>::release(ptrdiff_t update) noexcept
{
    m_impl->value = std::min(m_impl->value + update, least_max_value);
}

template <ptrdiff_t least_max_value>
void
counting_semaphore<least_max_value>::acquire() noexcept
{
    if (m_impl->value == 0)
    {
        return;
    }
    m_impl->value--;
}

template <ptrdiff_t least_max_value>
bool
counting_semaphore<least_max_value>::try_acquire() noexcept
{
    if (m_impl->value == 0)
    {
        return false;
    }
    m_impl->value--;
    return true;
}

template <ptrdiff_t least_max_value>
bool
counting_semaphore<least_max_value>::try_acquire_for_ms(const milliseconds)
{
    return try_acquire();
}

template class counting_semaphore<1>;

} // namespace os
