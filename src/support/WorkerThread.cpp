// =============================================================================
// TabFold — WorkerThread
// =============================================================================

#include "tabfold/support/WorkerThread.h"
#include "tabfold/support/Log.h"

#include <exception>

namespace TabFold
{

WorkerThread::~WorkerThread()
{
    stop();
}

void WorkerThread::start()
{
    if (running_.load(std::memory_order_relaxed))
        return;

    {
        std::lock_guard<std::mutex> guard(lock_);
        stopRequested_ = false;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { threadMain(); });
}

void WorkerThread::stop()
{
    {
        std::lock_guard<std::mutex> guard(lock_);
        stopRequested_ = true;
        queue_.clear();
    }
    wake_.notify_all();

    if (thread_.joinable())
        thread_.join();
    running_.store(false, std::memory_order_release);
}

void WorkerThread::post(Task task)
{
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (stopRequested_)
            return;
        queue_.push_back(std::move(task));
    }
    wake_.notify_one();
}

void WorkerThread::threadMain()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> guard(lock_);
            wake_.wait(guard, [this]() { return stopRequested_ || !queue_.empty(); });
            if (stopRequested_)
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // A throwing task must not take the worker down with it
        try
        {
            task();
        }
        catch (const std::exception& ex)
        {
            Log::error(L"Worker task failed: %ls", Log::widen(ex.what()).c_str());
        }
    }
}

} // namespace TabFold
