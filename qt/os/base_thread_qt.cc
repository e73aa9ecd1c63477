#include "base_thread.hh"

#include <QThread>

using namespace os;

struct BaseThread::Impl
{
    QThread* m_thread;
};

BaseThread::BaseThread()
{
    m_impl = new Impl;
    m_impl->m_thread = QThread::create([this]() { ThreadLoop(); });
}

BaseThread::~BaseThread()
{
    if (m_impl->m_thread->isRunning())
    {
        Stop();
        m_impl->m_thread->wait();
    }

    delete m_impl->m_thread;
    delete m_impl;
}

void
BaseThread::StopAndWait()
{
    Stop();
    m_impl->m_thread->wait();
}

void
BaseThread::Start(const char* name)
{
    m_impl->m_thread->setObjectName(name);
    m_impl->m_thread->start();
}

milliseconds
os::GetTimeStamp()
{
    static auto at_start = std::chrono::steady_clock::now();

    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - at_start);
}

void
os::Sleep(milliseconds delay)
{
    QThread::msleep(delay.count());
}
