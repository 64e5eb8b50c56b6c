#pragma once
// =============================================================================
// TabFold — Clock
// Monotonic time source used by every bounded wait. Production code sleeps
// on the steady clock; tests substitute a manual clock that advances on sleep.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <thread>

namespace TabFold
{

class Clock
{
public:
    virtual ~Clock() = default;
    virtual int64_t nowMs() const = 0;
    virtual void sleepMs(int ms) = 0;
};

class SteadyClock : public Clock
{
public:
    int64_t nowMs() const override
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

    void sleepMs(int ms) override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
};

} // namespace TabFold
