#pragma once
// =============================================================================
// TabFold — poll-until combinator
// Every wait in the fold engine (tab-child wait, location stabilisation,
// active-tab change, cookie resolution) is one call to pollUntil/pollFor.
//
// Semantics: probe immediately; stop on success; otherwise sleep `intervalMs`
// and retry until `timeoutMs` has elapsed since the first probe. The probe
// always runs at least once, even with a zero timeout.
// =============================================================================

#include "tabfold/common/Clock.h"

#include <optional>
#include <utility>

namespace TabFold
{

struct PollPolicy
{
    int intervalMs = 25;
    int timeoutMs = 250;
};

// Probe returns std::optional<T>; the first engaged value wins.
template <typename Probe>
auto pollFor(Clock& clock, PollPolicy policy, Probe&& probe) -> decltype(probe())
{
    const int64_t start = clock.nowMs();
    for (;;)
    {
        auto result = probe();
        if (result)
            return result;
        if (clock.nowMs() - start >= policy.timeoutMs)
            return decltype(probe()){};
        clock.sleepMs(policy.intervalMs);
    }
}

// Probe returns bool.
template <typename Probe>
bool pollUntil(Clock& clock, PollPolicy policy, Probe&& probe)
{
    auto wrapped = [&]() -> std::optional<bool> {
        if (probe())
            return true;
        return std::nullopt;
    };
    return pollFor(clock, policy, wrapped).has_value();
}

} // namespace TabFold
