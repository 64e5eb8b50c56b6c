// =============================================================================
// Unit tests for WorkerThread
// Real thread; every wait is bounded by a future.
// =============================================================================

#include <catch2/catch.hpp>
#include "tabfold/support/WorkerThread.h"

#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

using namespace TabFold;

TEST_CASE("Tasks run in posting order", "[WorkerThread]")
{
    WorkerThread worker;
    worker.start();
    REQUIRE(worker.isRunning());

    std::vector<int> order;
    std::promise<void> done;
    for (int i = 0; i < 5; ++i)
        worker.post([&order, i]() { order.push_back(i); });
    worker.post([&done]() { done.set_value(); });

    REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});

    worker.stop();
    REQUIRE_FALSE(worker.isRunning());
}

TEST_CASE("A throwing task does not stop the worker", "[WorkerThread]")
{
    WorkerThread worker;
    worker.start();

    std::promise<void> done;
    worker.post([]() { throw std::runtime_error("boom"); });
    worker.post([&done]() { done.set_value(); });

    REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    worker.stop();
}

TEST_CASE("Posting after stop is ignored", "[WorkerThread]")
{
    WorkerThread worker;
    worker.start();
    worker.stop();
    worker.stop();

    bool ran = false;
    worker.post([&ran]() { ran = true; });
    REQUIRE_FALSE(ran);
    REQUIRE_FALSE(worker.isRunning());
}
