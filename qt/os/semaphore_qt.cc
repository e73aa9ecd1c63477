#include "semaphore.hh"

#include <QSemaphore>

namespace os
{

struct Impl
{
    explicit Impl(int desired)
        : m_sem(desired)
    {
    }

    QSemaphore m_sem;
};

template <ptrdiff_t least_max_value>
counting_semaphore<least_max_value>::counting_semaphore(ptrdiff_t desired) noexcept
    : m_impl(std::make_unique<Impl>(static_cast<int>(desired)))
{
}

template <ptrdiff_t least_max_value>
counting_semaphore<least_max_value>::~counting_semaphore() = default;

template <ptrdiff_t least_max_value>
void
counting_semaphore<least_max_value>::release(ptrdiff_t update) noexcept
{
    // Saturate, a binary semaphore must not count above one
    auto& sem = m_impl->m_sem;
    for (auto i = 0; i < update && sem.available() < least_max_value; i++)
    {
        sem.release();
    }
}

template <ptrdiff_t least_max_value>
void
counting_semaphore<least_max_value>::acquire() noexcept
{
    m_impl->m_sem.acquire();
}

template <ptrdiff_t least_max_value>
bool
counting_semaphore<least_max_value>::try_acquire() noexcept
{
    return m_impl->m_sem.tryAcquire();
}

template <ptrdiff_t least_max_value>
bool
counting_semaphore<least_max_value>::try_acquire_for_ms(const milliseconds time)
{
    return m_impl->m_sem.tryAcquire(1, static_cast<int>(time.count()));
}

template class counting_semaphore<1>;

} // namespace os
