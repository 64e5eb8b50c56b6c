#pragma once
// =============================================================================
// TabFold — RegistrationWatcher
// Subscribes to the shell collection's "window registered" notification,
// which fires before a new window paints. Each notification carries a cookie
// that is resolved (on the worker, with retries) into a concrete
// RegisteredCandidate. When the channel is unavailable the engine falls back
// to show events for the rest of the process lifetime.
// =============================================================================

#include "tabfold/common/Types.h"

#include <atomic>
#include <functional>
#include <optional>

namespace TabFold
{

class CandidateClassifier;
class Clock;
class ShellNavigator;
class TaskQueue;
class WindowLedger;

class RegistrationWatcher
{
public:
    static constexpr int kResolvePollMs = 25;
    static constexpr int kResolveWaitMs = 1200;

    using CandidateCallback = std::function<void(const RegisteredCandidate&)>;
    using UnresolvedCallback = std::function<void()>;

    RegistrationWatcher(ShellNavigator& navigator, const CandidateClassifier& classifier,
                        WindowLedger& ledger, Clock& clock, TaskQueue& worker);

    // False if the channel is unsupported; logged once.
    bool start(CandidateCallback onCandidate, UnresolvedCallback onUnresolved);
    void stop();
    bool isHooked() const { return hooked_.load(std::memory_order_acquire); }

    // Called for every notification (apartment thread). Posts resolution to
    // the worker and returns.
    void onRegistered(long cookie);

    // Worker thread: poll until the cookie names a new shell window, or
    // the budget runs out.
    std::optional<RegisteredCandidate> resolveCookie(long cookie);

    // Single attempts, exposed for tests.
    std::optional<RegisteredCandidate> tryTakeByCookie(long cookie);
    std::optional<RegisteredCandidate> tryTakeFirstUnknown();

private:
    // Claim `topLevel` as known; false if it is not a new shell window.
    bool claim(WindowHandle topLevel);

    ShellNavigator& navigator_;
    const CandidateClassifier& classifier_;
    WindowLedger& ledger_;
    Clock& clock_;
    TaskQueue& worker_;

    CandidateCallback onCandidate_;
    UnresolvedCallback onUnresolved_;
    std::atomic<bool> hooked_{false};
};

} // namespace TabFold
