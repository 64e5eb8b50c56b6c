#pragma once
// =============================================================================
// TabFold — WorkerThread
// Single background thread draining a FIFO of tasks. Hook callbacks post
// here and return immediately; fold attempts therefore run one at a time.
// =============================================================================

#include "tabfold/common/TaskQueue.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace TabFold
{

class WorkerThread : public TaskQueue
{
public:
    ~WorkerThread() override;

    void start();

    // Finishes the task in flight, drops the rest, joins.
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    void post(Task task) override;

private:
    void threadMain();

    std::thread thread_;
    std::mutex lock_;
    std::condition_variable wake_;
    std::deque<Task> queue_;
    bool stopRequested_ = false;
    std::atomic<bool> running_{false};
};

} // namespace TabFold
