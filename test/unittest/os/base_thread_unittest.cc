#include "base_thread.hh"

// Threads are never started in the unit tests, ThreadFixture::DoRunLoop drives them
using namespace os;

struct BaseThread::Impl
{
};

BaseThread::BaseThread() = default;

BaseThread::~BaseThread() = default;

void
BaseThread::Start(const char*)
{
}

void
BaseThread::StopAndWait()
{
    Stop();
}

void
os::Sleep(milliseconds)
{
}
