#pragma once

#include "semaphore.hh"
#include "time.hh"

#include <atomic>
#include <optional>

namespace os
{

class BaseThread
{
public:
    BaseThread();

    virtual ~BaseThread();

    void Awake()
    {
        m_semaphore.release();
    }

    /**
     * @brief Start the thread
     *
     * @param name the name of the thread, for debugging
     */
    void Start(const char* name);

    void Stop()
    {
        m_running = false;
        Awake();
    }

    // Stop and wait for the thread to exit. Must be done before a derived thread is destroyed
    void StopAndWait();

    /// @brief run one iteration of the thread loop (the unit tests drive threads this way)
    std::optional<milliseconds> RunLoop()
    {
        return OnActivation();
    }

protected:
    /// @brief the thread has been awoken. Return the time until the next forced wakeup
    virtual std::optional<milliseconds> OnActivation() = 0;

    os::binary_semaphore& GetSemaphore()
    {
        return m_semaphore;
    }

private:
    struct Impl;

    void ThreadLoop()
    {
        while (m_running)
        {
            auto time = RunLoop();
            if (time)
            {
                m_semaphore.try_acquire_for(*time);
            }
            else
            {
                m_semaphore.acquire();
            }
        }
    }

    std::atomic_bool m_running {true};
    binary_semaphore m_semaphore {0};
    Impl* m_impl {nullptr}; // Raw pointer to allow forward declaration
};

} // namespace os
